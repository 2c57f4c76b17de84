#include "backends/onnx/onnx_backends.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace infer {
namespace onnx {

// =============================================================================
// CpuBackend
// =============================================================================

ErrorInfo CpuBackend::apply(Ort::SessionOptions& options) {
    (void)options;
    return ErrorInfo::ok();
}

// =============================================================================
// AcceleratedBackend
// =============================================================================

AcceleratedBackend::AcceleratedBackend(std::vector<std::string> preference)
    : preference_(std::move(preference))
{
    selected_ = selectProvider();
}

std::vector<std::string> AcceleratedBackend::defaultPreference() {
    return SessionConfig{}.accelerator_preference;
}

std::string AcceleratedBackend::selectProvider() const {
    auto available = ExecutionBackendFactory::getAvailableProviders();

    for (const auto& wanted : preference_) {
        if (wanted == "CPUExecutionProvider") {
            continue;
        }
        if (std::find(available.begin(), available.end(), wanted) != available.end()) {
            return wanted;
        }
    }
    return "";
}

ErrorInfo AcceleratedBackend::apply(Ort::SessionOptions& options) {
    if (selected_.empty()) {
        std::string wanted;
        for (const auto& p : preference_) {
            if (!wanted.empty()) wanted += ", ";
            wanted += p;
        }
        return ErrorInfo::error(ErrorCode::BACKEND_UNAVAILABLE,
            "No accelerated execution provider available",
            "wanted one of: " + wanted);
    }

    try {
        if (selected_ == "CUDAExecutionProvider") {
            OrtCUDAProviderOptions cuda_options;
            cuda_options.device_id = 0;
            options.AppendExecutionProvider_CUDA(cuda_options);
        } else {
            // Generic entry point takes the short provider name
            static const std::unordered_map<std::string, std::string> short_names = {
                {"CoreMLExecutionProvider", "CoreML"},
                {"XnnpackExecutionProvider", "XNNPACK"},
                {"QNNExecutionProvider", "QNN"},
                {"SNPEExecutionProvider", "SNPE"},
            };
            auto it = short_names.find(selected_);
            if (it == short_names.end()) {
                return ErrorInfo::error(ErrorCode::BACKEND_UNAVAILABLE,
                    "Unsupported execution provider", selected_);
            }
            options.AppendExecutionProvider(it->second);
        }
    } catch (const Ort::Exception& e) {
        return ErrorInfo::error(ErrorCode::BACKEND_UNAVAILABLE,
            "Failed to append execution provider " + selected_, e.what());
    }

    std::cout << "[AcceleratedBackend] Using " << selected_ << std::endl;
    return ErrorInfo::ok();
}

}  // namespace onnx

// =============================================================================
// ExecutionBackendFactory
// =============================================================================

std::unique_ptr<IExecutionBackend> ExecutionBackendFactory::create(const SessionConfig& config) {
    switch (config.backend) {
        case BackendType::CPU:
            return std::make_unique<onnx::CpuBackend>();
        case BackendType::ACCELERATED:
            return std::make_unique<onnx::AcceleratedBackend>(config.accelerator_preference);
        default:
            return nullptr;
    }
}

bool ExecutionBackendFactory::isAvailable(BackendType type) {
    switch (type) {
        case BackendType::CPU:
            return true;
        case BackendType::ACCELERATED:
            return onnx::AcceleratedBackend(onnx::AcceleratedBackend::defaultPreference())
                .isAvailable();
        default:
            return false;
    }
}

std::vector<BackendType> ExecutionBackendFactory::getAvailableBackends() {
    std::vector<BackendType> backends = {BackendType::CPU};
    if (isAvailable(BackendType::ACCELERATED)) {
        backends.push_back(BackendType::ACCELERATED);
    }
    return backends;
}

std::vector<std::string> ExecutionBackendFactory::getAvailableProviders() {
    try {
        return Ort::GetAvailableProviders();
    } catch (const Ort::Exception& e) {
        std::cerr << "[ExecutionBackendFactory] Cannot query providers: " << e.what() << std::endl;
        return {"CPUExecutionProvider"};
    }
}

}  // namespace infer
