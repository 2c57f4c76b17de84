/**
 * onnx_infer - C interface implementation
 *
 * 将 C 调用转发到 infer::InferenceSession, 把 ErrorInfo 转换为哨兵值和线程局部错误文本。
 */

#include "onnx_infer_api.h"

#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <new>
#include <string>
#include <utility>

#include "inference_session.hpp"
#include "session_registry.hpp"

namespace {

using infer::ErrorCode;
using infer::ErrorInfo;

// 每个线程各自的最近错误
thread_local std::string t_last_error;
thread_local bool t_has_error = false;

void setLastError(const ErrorInfo& error) {
    t_last_error = "[" + std::string(infer::errorCodeToString(error.code)) + "] " +
                   error.describe();
    t_has_error = true;
}

void clearLastError() {
    t_last_error.clear();
    t_has_error = false;
}

int toStatus(ErrorCode code) {
    return -static_cast<int>(code);
}

int fail(const ErrorInfo& error) {
    setLastError(error);
    return toStatus(error.code);
}

// 句柄是登记表编号, 不是会话地址
infer::SessionRegistry::Handle toHandle(OnnxSession* session) {
    return reinterpret_cast<infer::SessionRegistry::Handle>(session);
}

OnnxSession* fromHandle(infer::SessionRegistry::Handle handle) {
    return reinterpret_cast<OnnxSession*>(handle);
}

ErrorInfo unexpected(const char* what, const std::exception& e) {
    return ErrorInfo::error(ErrorCode::INTERNAL_ERROR, what, e.what());
}

std::shared_ptr<infer::InferenceSession> lookup(OnnxSession* handle) {
    if (!handle) {
        return nullptr;
    }
    return infer::SessionRegistry::instance().find(toHandle(handle));
}

ErrorInfo invalidHandle() {
    return ErrorInfo::error(ErrorCode::INVALID_HANDLE,
        "Invalid session handle (null or already destroyed)");
}

// OnnxSessionRun 与 OnnxSessionRunChecked 共用; capacity 为 nullptr 时不检查数据缓冲区
int runSession(OnnxSession* handle,
               const char* input_name,
               const float* input_data,
               const int64_t* input_shape,
               size_t input_shape_len,
               const char* output_name,
               float* output_data,
               const size_t* capacity,
               int64_t* output_shape,
               size_t* output_shape_len) {
    auto session = lookup(handle);
    if (!session) {
        return fail(invalidHandle());
    }

    if (!input_name || !output_name) {
        return fail(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Input and output names must not be NULL"));
    }
    if (!input_shape && input_shape_len > 0) {
        return fail(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Input shape is NULL"));
    }
    if (!output_shape_len || (!output_shape && *output_shape_len > 0)) {
        return fail(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Output shape buffer is NULL"));
    }

    try {
        infer::TensorView input;
        input.name = input_name;
        input.data = input_data;
        if (input_shape_len > 0) {
            input.shape.assign(input_shape, input_shape + input_shape_len);
        }

        auto result = session->run(input, output_name);
        if (!result.isOk()) {
            return fail(result.error);
        }

        const infer::Tensor& tensor = result.value;

        if (tensor.rank() > *output_shape_len) {
            return fail(ErrorInfo::error(ErrorCode::BUFFER_TOO_SMALL,
                "Output shape buffer too small",
                "rank " + std::to_string(tensor.rank()) +
                ", capacity " + std::to_string(*output_shape_len)));
        }
        if (capacity && tensor.elementCount() > *capacity) {
            return fail(ErrorInfo::error(ErrorCode::BUFFER_TOO_SMALL,
                "Output buffer too small for '" + std::string(output_name) + "'",
                "need " + std::to_string(tensor.elementCount()) +
                " floats, capacity " + std::to_string(*capacity)));
        }
        if (!output_data && tensor.elementCount() > 0) {
            return fail(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                "Output data buffer is NULL"));
        }

        if (tensor.elementCount() > 0) {
            std::memcpy(output_data, tensor.data.data(), tensor.elementCount() * sizeof(float));
        }
        for (size_t i = 0; i < tensor.rank(); ++i) {
            output_shape[i] = tensor.shape[i];
        }
        *output_shape_len = tensor.rank();
    } catch (const std::bad_alloc& e) {
        return fail(ErrorInfo::error(ErrorCode::OUT_OF_MEMORY,
            "Out of memory during inference", e.what()));
    } catch (const std::exception& e) {
        return fail(unexpected("Unexpected error during inference", e));
    }

    clearLastError();
    return 0;
}

}  // namespace

extern "C" {

OnnxSession* OnnxSessionCreate(const char* model_path, int num_threads, int use_accelerator) {
    if (!model_path || model_path[0] == '\0') {
        setLastError(ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Model path is empty"));
        return nullptr;
    }

    infer::SessionConfig config = use_accelerator
        ? infer::SessionConfig::accelerated(model_path, num_threads)
        : infer::SessionConfig::cpu(model_path, num_threads);

    try {
        auto created = infer::InferenceSession::create(config);
        if (!created.isOk()) {
            setLastError(created.error);
            return nullptr;
        }

        auto handle = infer::SessionRegistry::instance().add(std::move(created.value));
        clearLastError();
        return fromHandle(handle);
    } catch (const std::bad_alloc& e) {
        setLastError(ErrorInfo::error(ErrorCode::OUT_OF_MEMORY,
            "Out of memory while creating session", e.what()));
        return nullptr;
    } catch (const std::exception& e) {
        setLastError(unexpected("Unexpected error while creating session", e));
        return nullptr;
    }
}

void OnnxSessionDestroy(OnnxSession* session) {
    if (!session) {
        return;
    }
    try {
        infer::SessionRegistry::instance().remove(toHandle(session));
    } catch (const std::exception& e) {
        std::cerr << "[onnx_infer] Destroy failed: " << e.what() << std::endl;
    }
}

const char* OnnxSessionGetLastError(void) {
    return t_has_error ? t_last_error.c_str() : nullptr;
}

size_t OnnxSessionGetOutputSize(OnnxSession* handle,
                                const int64_t* input_shape,
                                size_t input_shape_len,
                                const char* output_name) {
    auto session = lookup(handle);
    if (!session) {
        setLastError(invalidHandle());
        return 0;
    }
    if (!output_name) {
        setLastError(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Output name is NULL"));
        return 0;
    }
    if (!input_shape && input_shape_len > 0) {
        setLastError(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Input shape is NULL"));
        return 0;
    }

    try {
        infer::Shape shape;
        if (input_shape_len > 0) {
            shape.assign(input_shape, input_shape + input_shape_len);
        }

        auto result = session->getOutputSize(shape, output_name);
        if (!result.isOk()) {
            setLastError(result.error);
            return 0;
        }
        clearLastError();
        return result.value;
    } catch (const std::bad_alloc& e) {
        setLastError(ErrorInfo::error(ErrorCode::OUT_OF_MEMORY,
            "Out of memory while resolving output size", e.what()));
        return 0;
    } catch (const std::exception& e) {
        setLastError(unexpected("Unexpected error while resolving output size", e));
        return 0;
    }
}

int OnnxSessionRun(OnnxSession* session,
                   const char* input_name,
                   const float* input_data,
                   const int64_t* input_shape,
                   size_t input_shape_len,
                   const char* output_name,
                   float* output_data,
                   int64_t* output_shape,
                   size_t* output_shape_len) {
    return runSession(session, input_name, input_data, input_shape, input_shape_len,
                      output_name, output_data, nullptr, output_shape, output_shape_len);
}

int OnnxSessionRunChecked(OnnxSession* session,
                          const char* input_name,
                          const float* input_data,
                          const int64_t* input_shape,
                          size_t input_shape_len,
                          const char* output_name,
                          float* output_data,
                          size_t output_capacity,
                          int64_t* output_shape,
                          size_t* output_shape_len) {
    return runSession(session, input_name, input_data, input_shape, input_shape_len,
                      output_name, output_data, &output_capacity, output_shape,
                      output_shape_len);
}

}  // extern "C"
