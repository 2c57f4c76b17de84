#ifndef INFER_CONFIG_HPP
#define INFER_CONFIG_HPP

#include <string>
#include <vector>

#include "infer_types.hpp"

namespace infer {

// =============================================================================
// Session Configuration (会话配置)
// =============================================================================

struct SessionConfig {
    // -------------------------------------------------------------------------
    // 模型
    // -------------------------------------------------------------------------

    std::string model_path;         // ONNX 模型文件路径 (支持 ~)

    // -------------------------------------------------------------------------
    // 线程
    // -------------------------------------------------------------------------

    int num_threads = 0;            // intra-op 线程数, 0 = ONNX Runtime 默认
    int inter_op_threads = 0;       // inter-op 线程数, 0 = 默认

    // -------------------------------------------------------------------------
    // 执行后端
    // -------------------------------------------------------------------------

    BackendType backend = BackendType::CPU;

    // 加速后端按顺序选择第一个可用的 provider
    std::vector<std::string> accelerator_preference = {
        "CUDAExecutionProvider",
        "CoreMLExecutionProvider",
        "XnnpackExecutionProvider",
    };

    bool fallback_to_cpu = false;   // 加速后端不可用时退回 CPU (否则创建失败)

    // -------------------------------------------------------------------------
    // 会话选项
    // -------------------------------------------------------------------------

    GraphOptimization graph_optimization = GraphOptimization::ALL;
    bool enable_mem_arena = true;   // 嵌入式设备上可关闭
    bool enable_mem_pattern = true;

    // -------------------------------------------------------------------------
    // 日志
    // -------------------------------------------------------------------------

    LogLevel log_level = LogLevel::WARNING;
    std::string log_id = "onnx_infer";
    bool verbose = false;           // 每次运行打印耗时

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief CPU 会话配置
    static SessionConfig cpu(const std::string& model_path, int num_threads = 0) {
        SessionConfig config;
        config.model_path = model_path;
        config.num_threads = num_threads;
        config.backend = BackendType::CPU;
        return config;
    }

    /// @brief 加速后端会话配置
    static SessionConfig accelerated(const std::string& model_path, int num_threads = 0) {
        SessionConfig config;
        config.model_path = model_path;
        config.num_threads = num_threads;
        config.backend = BackendType::ACCELERATED;
        return config;
    }

    SessionConfig withThreads(int threads) const {
        SessionConfig config = *this;
        config.num_threads = threads;
        return config;
    }

    SessionConfig withCpuFallback() const {
        SessionConfig config = *this;
        config.fallback_to_cpu = true;
        return config;
    }

    SessionConfig withVerbose() const {
        SessionConfig config = *this;
        config.verbose = true;
        return config;
    }

    /// @brief 关闭内存 arena 与 mem pattern (低内存设备)
    SessionConfig withoutArena() const {
        SessionConfig config = *this;
        config.enable_mem_arena = false;
        config.enable_mem_pattern = false;
        return config;
    }
};

// =============================================================================
// Config Validator (配置验证器)
// =============================================================================

class ConfigValidator {
public:
    static ErrorInfo validate(const SessionConfig& config) {
        if (config.model_path.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Model path is required");
        }

        if (config.num_threads < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "num_threads must be >= 0",
                "got " + std::to_string(config.num_threads));
        }

        if (config.inter_op_threads < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "inter_op_threads must be >= 0",
                "got " + std::to_string(config.inter_op_threads));
        }

        if (config.backend == BackendType::ACCELERATED &&
            config.accelerator_preference.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "accelerator_preference must not be empty for accelerated backend");
        }

        return ErrorInfo::ok();
    }
};

}  // namespace infer

#endif  // INFER_CONFIG_HPP
