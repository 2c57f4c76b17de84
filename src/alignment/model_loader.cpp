/**
 * @file model_loader.cpp
 * @brief Model file management and downloading implementation
 */

#include "alignment/model_loader.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace infer {
namespace align {

ModelLoader::ModelLoader()
    : config_(Config{})
{
    model_dir_expanded_ = expandPath(config_.model_dir);
}

ModelLoader::ModelLoader(const Config& config)
    : config_(config)
{
    model_dir_expanded_ = expandPath(config_.model_dir);
}

ModelLoader::~ModelLoader() = default;

std::string ModelLoader::expandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");  // Windows
    }

    return home ? (std::string(home) + path.substr(1)) : path;
}

std::vector<std::string> ModelLoader::getRequiredFiles() const {
    return {
        config_.model_file,
        config_.labels_file
    };
}

std::vector<std::string> ModelLoader::getMissingFiles() const {
    std::vector<std::string> missing;
    for (const auto& file : getRequiredFiles()) {
        if (!isModelAvailable(file)) {
            missing.push_back(file);
        }
    }
    return missing;
}

ErrorInfo ModelLoader::ensureModelsExist(ProgressCallback progress_cb) {
    auto missing = getMissingFiles();
    if (missing.empty()) {
        std::cout << "[ModelLoader] All models available" << std::endl;
        return ErrorInfo::ok();
    }

    for (const auto& file : missing) {
        std::cout << "[ModelLoader] Missing: " << file << std::endl;
    }

    if (config_.base_url.empty()) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Model files missing in " + model_dir_expanded_,
            "no download URL configured; place " + missing.front() + " there manually");
    }

    auto err = createDirectory();
    if (!err.isOk()) {
        return err;
    }

    std::cout << "[ModelLoader] Downloading models..." << std::endl;
    for (const auto& file : missing) {
        err = downloadModel(file, progress_cb);
        if (!err.isOk()) {
            return err;
        }
    }

    return ErrorInfo::ok();
}

ErrorInfo ModelLoader::downloadModel(const std::string& filename, ProgressCallback progress_cb) {
    if (config_.base_url.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "base_url is not set");
    }

    auto err = createDirectory();
    if (!err.isOk()) {
        return err;
    }

    std::string url = config_.base_url;
    if (url.back() != '/') {
        url += '/';
    }
    url += filename;

    return downloadFile(url, getModelPath(filename), filename, progress_cb);
}

std::string ModelLoader::getModelPath(const std::string& filename) const {
    return model_dir_expanded_ + "/" + filename;
}

bool ModelLoader::isModelAvailable(const std::string& filename) const {
    return fileExists(getModelPath(filename));
}

ErrorInfo ModelLoader::createDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(model_dir_expanded_, ec);
    if (ec) {
        std::cerr << "[ModelLoader] Failed to create directory: " << ec.message() << std::endl;
        return ErrorInfo::error(ErrorCode::IO_ERROR,
            "Failed to create directory " + model_dir_expanded_, ec.message());
    }
    return ErrorInfo::ok();
}

bool ModelLoader::fileExists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

// CURL callback for writing data
static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::ofstream* file = static_cast<std::ofstream*>(userp);
    size_t total_size = size * nmemb;
    file->write(static_cast<const char*>(contents), total_size);
    return file->good() ? total_size : 0;
}

// CURL progress callback wrapper
struct ProgressData {
    ModelLoader::ProgressCallback cb;
    std::string file;
};

static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                            curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* data = static_cast<ProgressData*>(clientp);
    if (data->cb && dltotal > 0) {
        data->cb(data->file, static_cast<double>(dlnow) / static_cast<double>(dltotal));
    }
    return 0;
}

ErrorInfo ModelLoader::downloadFile(const std::string& url,
                                    const std::string& output_path,
                                    const std::string& filename,
                                    ProgressCallback progress_cb) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "[ModelLoader] Failed to init curl" << std::endl;
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Failed to init curl");
    }

    // 先写入临时文件, 成功后再改名, 中断的下载不会留下半个模型
    std::string part_path = output_path + ".part";

    std::ofstream file(part_path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ModelLoader] Cannot open: " << part_path << std::endl;
        curl_easy_cleanup(curl);
        return ErrorInfo::error(ErrorCode::IO_ERROR, "Cannot open " + part_path);
    }

    ProgressData progress_data{progress_cb, filename};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "onnx_infer/1.0");
    if (config_.timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
    }

    if (progress_cb) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress_data);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);

    curl_easy_cleanup(curl);
    file.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        std::cerr << "[ModelLoader] Download failed: " << curl_easy_strerror(res) << std::endl;
        std::filesystem::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::NETWORK_ERROR,
            "Download failed: " + url, curl_easy_strerror(res));
    }

    std::filesystem::rename(part_path, output_path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::IO_ERROR,
            "Cannot move download into place: " + output_path, reason);
    }

    if (progress_cb) {
        progress_cb(filename, 1.0);
    }

    std::cout << "[ModelLoader] Downloaded: " << output_path << std::endl;
    return ErrorInfo::ok();
}

}  // namespace align
}  // namespace infer
