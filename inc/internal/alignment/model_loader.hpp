/**
 * @file model_loader.hpp
 * @brief Model file management for the forced-alignment model
 *
 * Resolves the model directory, checks for the required files and
 * optionally downloads missing ones from a configured base URL.
 */

#ifndef INFER_ALIGN_MODEL_LOADER_HPP
#define INFER_ALIGN_MODEL_LOADER_HPP

#include <functional>
#include <string>
#include <vector>

#include "../infer_types.hpp"

namespace infer {
namespace align {

/**
 * @class ModelLoader
 * @brief Manages MMS-FA model files
 *
 * Provides:
 * - Model file path management
 * - Per-file downloading via libcurl (when base_url is set)
 * - Path expansion (~ to home directory)
 */
class ModelLoader {
public:
    /**
     * @brief Download progress callback
     * @param file File currently being downloaded
     * @param progress Download progress [0.0, 1.0]
     */
    using ProgressCallback = std::function<void(const std::string& file, double progress)>;

    struct Config {
        std::string model_dir = "~/.cache/mms-fa";

        // 为空时不下载, 缺失文件直接报错
        // 每个文件从 base_url + "/" + filename 获取 (支持 https:// 与 file://)
        std::string base_url;

        std::string model_file = "mms-fa.onnx";
        std::string labels_file = "labels.txt";

        long timeout_seconds = 0;   // 0 = 不限制
    };

    ModelLoader();
    explicit ModelLoader(const Config& config);
    ~ModelLoader();

    /**
     * @brief Ensure all required files exist, downloading missing ones if possible
     * @return OK, MODEL_NOT_FOUND (no base_url), NETWORK_ERROR or IO_ERROR
     */
    ErrorInfo ensureModelsExist(ProgressCallback progress_cb = nullptr);

    /**
     * @brief Download one file from base_url into the model directory
     */
    ErrorInfo downloadModel(const std::string& filename, ProgressCallback progress_cb = nullptr);

    std::string getModelPath(const std::string& filename) const;

    bool isModelAvailable(const std::string& filename) const;

    /// @brief Files still missing from the model directory
    std::vector<std::string> getMissingFiles() const;

    std::string getModelDir() const { return model_dir_expanded_; }

    const Config& getConfig() const { return config_; }

    /**
     * @brief Expand path (replace ~ with home directory)
     */
    static std::string expandPath(const std::string& path);

    std::vector<std::string> getRequiredFiles() const;

private:
    Config config_;
    std::string model_dir_expanded_;

    ErrorInfo createDirectory();
    ErrorInfo downloadFile(const std::string& url,
        const std::string& output_path,
        const std::string& filename,
        ProgressCallback progress_cb);
    bool fileExists(const std::string& path) const;
};

}  // namespace align
}  // namespace infer

#endif  // INFER_ALIGN_MODEL_LOADER_HPP
