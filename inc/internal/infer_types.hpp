#ifndef INFER_TYPES_HPP
#define INFER_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace infer {

// =============================================================================
// Backend Type (执行后端类型)
// =============================================================================

enum class BackendType {
    CPU,            // Generic CPU execution provider
    ACCELERATED,    // First available hardware provider (CUDA, CoreML, ...)
};

inline const char* backendTypeToString(BackendType type) {
    switch (type) {
        case BackendType::CPU:         return "cpu";
        case BackendType::ACCELERATED: return "accelerated";
        default:                       return "unknown";
    }
}

// =============================================================================
// Graph Optimization Level
// =============================================================================

enum class GraphOptimization {
    DISABLED,
    BASIC,
    EXTENDED,
    ALL,
};

// =============================================================================
// Log Level (ONNX Runtime 日志级别)
// =============================================================================

enum class LogLevel {
    VERBOSE,
    INFO,
    WARNING,
    ERR,            // 避免与 <windows.h> 的 ERROR 宏冲突
    FATAL,
};

// =============================================================================
// Error Info (错误信息)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置 / 资源获取错误 (1xx)
    INVALID_CONFIG = 100,
    MODEL_NOT_FOUND = 101,
    INVALID_MODEL = 102,
    BACKEND_UNAVAILABLE = 103,

    // 调用错误 (2xx)
    INVALID_HANDLE = 200,
    INVALID_ARGUMENT = 201,
    UNKNOWN_TENSOR = 202,
    SHAPE_MISMATCH = 203,
    BUFFER_TOO_SMALL = 204,
    INFERENCE_FAILED = 205,

    // I/O 错误 (3xx)
    IO_ERROR = 300,
    NETWORK_ERROR = 301,
    UNSUPPORTED_FORMAT = 302,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
    OUT_OF_MEMORY = 401,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                  return "OK";
        case ErrorCode::INVALID_CONFIG:      return "INVALID_CONFIG";
        case ErrorCode::MODEL_NOT_FOUND:     return "MODEL_NOT_FOUND";
        case ErrorCode::INVALID_MODEL:       return "INVALID_MODEL";
        case ErrorCode::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        case ErrorCode::INVALID_HANDLE:      return "INVALID_HANDLE";
        case ErrorCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case ErrorCode::UNKNOWN_TENSOR:      return "UNKNOWN_TENSOR";
        case ErrorCode::SHAPE_MISMATCH:      return "SHAPE_MISMATCH";
        case ErrorCode::BUFFER_TOO_SMALL:    return "BUFFER_TOO_SMALL";
        case ErrorCode::INFERENCE_FAILED:    return "INFERENCE_FAILED";
        case ErrorCode::IO_ERROR:            return "IO_ERROR";
        case ErrorCode::NETWORK_ERROR:       return "NETWORK_ERROR";
        case ErrorCode::UNSUPPORTED_FORMAT:  return "UNSUPPORTED_FORMAT";
        case ErrorCode::INTERNAL_ERROR:      return "INTERNAL_ERROR";
        case ErrorCode::OUT_OF_MEMORY:       return "OUT_OF_MEMORY";
        default:                             return "UNKNOWN";
    }
}

struct ErrorInfo {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string detail;         // 详细信息(调试用, 通常为 ONNX Runtime 原始消息)

    bool isOk() const { return code == ErrorCode::OK; }

    /// @brief "message: detail" 形式的完整描述
    std::string describe() const {
        if (detail.empty()) {
            return message;
        }
        return message + ": " + detail;
    }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

// =============================================================================
// Result<T> (值或错误)
// =============================================================================
//
// 成功时 error.isOk() 为 true 且 value 有效; 失败时 value 为默认值。
// 与 C 接口的哨兵值不同, 合法的零值结果不会与失败混淆。
//

template <typename T>
struct Result {
    ErrorInfo error;
    T value{};

    bool isOk() const { return error.isOk(); }
    explicit operator bool() const { return isOk(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorInfo e) {
        Result r;
        r.error = std::move(e);
        return r;
    }
};

// =============================================================================
// Tensor (命名的 float 张量)
// =============================================================================

using Shape = std::vector<int64_t>;

/// @brief 单个 float 张量允许的最大元素数 (字节数不超过 PTRDIFF_MAX)
constexpr size_t MAX_TENSOR_ELEMENTS =
    static_cast<size_t>(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(float);

/**
 * @brief 带溢出检查的元素数
 * @return 任一维度为负, 或乘积超过 MAX_TENSOR_ELEMENTS 时返回 false
 *
 * 含 0 维度的形状元素数为 0, 其余维度再大也合法。
 */
inline bool checkedElementCount(const Shape& shape, size_t& count) {
    count = 1;
    bool has_zero = false;
    for (int64_t dim : shape) {
        if (dim < 0) {
            count = 0;
            return false;
        }
        if (dim == 0) {
            has_zero = true;
        }
    }
    if (has_zero) {
        count = 0;
        return true;
    }

    for (int64_t dim : shape) {
        const size_t d = static_cast<size_t>(dim);
        if (count > MAX_TENSOR_ELEMENTS / d) {
            count = 0;
            return false;
        }
        count *= d;
    }
    return true;
}

/// @brief 形状的元素数; 维度为负或溢出时返回 0 (需要区分时用 checkedElementCount)
inline size_t shapeElementCount(const Shape& shape) {
    size_t count = 0;
    return checkedElementCount(shape, count) ? count : 0;
}

inline std::string shapeToString(const Shape& shape) {
    std::string s = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(shape[i]);
    }
    s += "]";
    return s;
}

/// @brief 推理输出, 拥有数据与形状
struct Tensor {
    std::string name;
    Shape shape;
    std::vector<float> data;

    size_t elementCount() const { return data.size(); }
    size_t rank() const { return shape.size(); }
};

/// @brief 非拥有的输入张量视图 (调用者保证数据在调用期间有效)
struct TensorView {
    std::string name;
    const float* data = nullptr;
    Shape shape;

    size_t elementCount() const { return shapeElementCount(shape); }
};

// =============================================================================
// Tensor Metadata (模型声明的输入/输出信息)
// =============================================================================

struct TensorInfo {
    std::string name;
    Shape shape;                            // -1 表示动态维度
    std::vector<std::string> symbolic_dims; // 与 shape 等长, 静态维度为空串
    int element_type = 0;                   // ONNXTensorElementDataType

    bool isDynamic() const {
        for (int64_t dim : shape) {
            if (dim < 0) return true;
        }
        return false;
    }
};

// =============================================================================
// Inference Stats (推理统计)
// =============================================================================

struct InferenceStats {
    double inference_time_ms = 0;   ///< ONNX Run 耗时
    double copy_time_ms = 0;        ///< 输出拷贝耗时
    double total_time_ms = 0;       ///< 总耗时
    uint64_t run_count = 0;         ///< 累计运行次数
};

}  // namespace infer

#endif  // INFER_TYPES_HPP
