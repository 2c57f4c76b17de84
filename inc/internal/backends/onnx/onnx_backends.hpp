#ifndef INFER_ONNX_BACKENDS_HPP
#define INFER_ONNX_BACKENDS_HPP

#include <string>
#include <vector>

#include "../execution_backend.hpp"

namespace infer {
namespace onnx {

// =============================================================================
// CPU Backend
// =============================================================================
//
// ONNX Runtime 默认即使用 CPU provider, apply() 不追加任何内容。
//

class CpuBackend : public IExecutionBackend {
public:
    BackendType getType() const override { return BackendType::CPU; }
    std::string getName() const override { return "CPU"; }
    std::string getProviderName() const override { return "CPUExecutionProvider"; }
    bool isAvailable() const override { return true; }

    ErrorInfo apply(Ort::SessionOptions& options) override;
};

// =============================================================================
// Accelerated Backend
// =============================================================================
//
// 按 preference 顺序选择第一个在 Ort::GetAvailableProviders() 中出现的 provider。
//

class AcceleratedBackend : public IExecutionBackend {
public:
    explicit AcceleratedBackend(std::vector<std::string> preference);

    BackendType getType() const override { return BackendType::ACCELERATED; }
    std::string getName() const override { return "Accelerated"; }

    /// @brief 选中的 provider, 无可用 provider 时为空
    std::string getProviderName() const override { return selected_; }
    bool isAvailable() const override { return !selected_.empty(); }

    ErrorInfo apply(Ort::SessionOptions& options) override;

    /// @brief 默认的加速 provider 偏好顺序
    static std::vector<std::string> defaultPreference();

private:
    std::vector<std::string> preference_;
    std::string selected_;

    std::string selectProvider() const;
};

}  // namespace onnx
}  // namespace infer

#endif  // INFER_ONNX_BACKENDS_HPP
