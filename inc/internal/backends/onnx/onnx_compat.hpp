/**
 * @file onnx_compat.hpp
 * @brief ONNX Runtime compatibility layer for RISC-V and other platforms
 *
 * Include this header BEFORE any ONNX Runtime headers to fix
 * platform-specific compatibility issues.
 */

#ifndef INFER_ONNX_COMPAT_HPP
#define INFER_ONNX_COMPAT_HPP

#include <cstdint>

// RISC-V toolchains may lack native __fp16
#if defined(__riscv) || defined(__riscv__)
    #ifndef __fp16
        typedef uint16_t __fp16;
    #endif
#endif

#include <onnxruntime_cxx_api.h>

#include "infer_types.hpp"

namespace infer {
namespace onnx {

inline OrtLoggingLevel toOrtLoggingLevel(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return ORT_LOGGING_LEVEL_VERBOSE;
        case LogLevel::INFO:    return ORT_LOGGING_LEVEL_INFO;
        case LogLevel::WARNING: return ORT_LOGGING_LEVEL_WARNING;
        case LogLevel::ERR:     return ORT_LOGGING_LEVEL_ERROR;
        case LogLevel::FATAL:   return ORT_LOGGING_LEVEL_FATAL;
        default:                return ORT_LOGGING_LEVEL_WARNING;
    }
}

inline GraphOptimizationLevel toOrtOptimizationLevel(GraphOptimization level) {
    switch (level) {
        case GraphOptimization::DISABLED: return GraphOptimizationLevel::ORT_DISABLE_ALL;
        case GraphOptimization::BASIC:    return GraphOptimizationLevel::ORT_ENABLE_BASIC;
        case GraphOptimization::EXTENDED: return GraphOptimizationLevel::ORT_ENABLE_EXTENDED;
        case GraphOptimization::ALL:      return GraphOptimizationLevel::ORT_ENABLE_ALL;
        default:                          return GraphOptimizationLevel::ORT_ENABLE_ALL;
    }
}

/// @brief Map an ONNX Runtime error code onto the wrapper taxonomy
inline ErrorCode fromOrtErrorCode(OrtErrorCode code) {
    switch (code) {
        case ORT_NO_SUCHFILE:      return ErrorCode::MODEL_NOT_FOUND;
        case ORT_INVALID_PROTOBUF:
        case ORT_INVALID_GRAPH:
        case ORT_NOT_IMPLEMENTED:  return ErrorCode::INVALID_MODEL;
        case ORT_INVALID_ARGUMENT: return ErrorCode::INVALID_ARGUMENT;
        case ORT_NO_MODEL:         return ErrorCode::INVALID_MODEL;
        case ORT_FAIL:
        case ORT_RUNTIME_EXCEPTION:
        default:                   return ErrorCode::INFERENCE_FAILED;
    }
}

}  // namespace onnx
}  // namespace infer

#endif  // INFER_ONNX_COMPAT_HPP
