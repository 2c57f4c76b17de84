#ifndef INFER_EXECUTION_BACKEND_HPP
#define INFER_EXECUTION_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "../infer_types.hpp"
#include "../infer_config.hpp"
#include "onnx/onnx_compat.hpp"

namespace infer {

// =============================================================================
// Execution Backend Interface (执行后端抽象接口)
// =============================================================================
//
// 每个后端负责把自己的 execution provider 追加到 SessionOptions 上。
// InferenceSession 只依赖此接口, 不关心具体的硬件路径。
//
// 实现新后端的步骤:
// 1. 继承 IExecutionBackend
// 2. 实现所有纯虚函数
// 3. 在 ExecutionBackendFactory 中注册
//

class IExecutionBackend {
public:
    virtual ~IExecutionBackend() = default;

    /// @brief 获取后端类型
    virtual BackendType getType() const = 0;

    /// @brief 获取后端名称 (用于日志)
    virtual std::string getName() const = 0;

    /// @brief 实际使用的 ONNX Runtime provider 名称
    virtual std::string getProviderName() const = 0;

    /// @brief 当前进程中是否可用
    virtual bool isAvailable() const = 0;

    /// @brief 把 provider 追加到会话选项
    /// @param options ONNX Runtime 会话选项
    /// @return 错误信息, OK表示成功
    virtual ErrorInfo apply(Ort::SessionOptions& options) = 0;
};

// =============================================================================
// Backend Factory (后端工厂)
// =============================================================================

class ExecutionBackendFactory {
public:
    /// @brief 创建执行后端实例
    /// @param config 会话配置 (backend 与 accelerator_preference)
    /// @return 后端实例, 类型未知时返回 nullptr
    static std::unique_ptr<IExecutionBackend> create(const SessionConfig& config);

    /// @brief 检查后端类型是否可用
    static bool isAvailable(BackendType type);

    /// @brief 获取所有可用的后端类型
    static std::vector<BackendType> getAvailableBackends();

    /// @brief ONNX Runtime 报告的 provider 列表
    static std::vector<std::string> getAvailableProviders();
};

}  // namespace infer

#endif  // INFER_EXECUTION_BACKEND_HPP
