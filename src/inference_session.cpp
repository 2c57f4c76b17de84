/**
 * @file inference_session.cpp
 * @brief InferenceSession implementation
 */

#include "inference_session.hpp"
#include "backends/onnx/onnx_backends.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>  // NOLINT(build/c++17)
#include <iomanip>
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace infer {

// Helper function to expand ~ to home directory
static std::string expandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");  // Windows
    }

    if (!home) {
        return path;
    }

    return std::string(home) + path.substr(1);
}

static ErrorInfo fromOrtException(const Ort::Exception& e, ErrorCode fallback,
                                  const std::string& message) {
    ErrorCode code = onnx::fromOrtErrorCode(e.GetOrtErrorCode());
    if (code == ErrorCode::INFERENCE_FAILED) {
        code = fallback;
    }
    return ErrorInfo::error(code, message, e.what());
}

static TensorInfo readTensorInfo(const std::string& name, const Ort::TypeInfo& type_info) {
    TensorInfo info;
    info.name = name;

    if (type_info.GetONNXType() != ONNX_TYPE_TENSOR) {
        return info;
    }

    auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
    info.element_type = static_cast<int>(tensor_info.GetElementType());
    info.shape = tensor_info.GetShape();

    std::vector<const char*> symbolic(tensor_info.GetDimensionsCount(), nullptr);
    if (!symbolic.empty()) {
        tensor_info.GetSymbolicDimensions(symbolic.data(), symbolic.size());
    }

    info.symbolic_dims.reserve(symbolic.size());
    for (const char* dim : symbolic) {
        info.symbolic_dims.push_back(dim ? dim : "");
    }

    return info;
}

// =============================================================================
// Lifecycle
// =============================================================================

InferenceSession::InferenceSession(PrivateTag, const SessionConfig& config)
    : config_(config)
    , memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
{
}

InferenceSession::~InferenceSession() {
    release();
}

Result<std::unique_ptr<InferenceSession>> InferenceSession::create(const SessionConfig& config) {
    using CreateResult = Result<std::unique_ptr<InferenceSession>>;

    auto validation_error = ConfigValidator::validate(config);
    if (!validation_error.isOk()) {
        return CreateResult::failure(validation_error);
    }

    SessionConfig resolved = config;
    resolved.model_path = expandPath(config.model_path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(resolved.model_path, ec)) {
        return CreateResult::failure(ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Model file not found: " + resolved.model_path));
    }

    std::unique_ptr<InferenceSession> session;
    try {
        session = std::make_unique<InferenceSession>(PrivateTag{}, resolved);
    } catch (const Ort::Exception& e) {
        return CreateResult::failure(ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            "Failed to create CPU memory info", e.what()));
    }

    auto err = session->initializeSession();
    if (!err.isOk()) {
        std::cerr << "[InferenceSession] " << err.describe() << std::endl;
        return CreateResult::failure(err);
    }

    std::cout << "[InferenceSession] Session created: " << resolved.model_path
            << " (" << session->provider_name_ << ")" << std::endl;
    return CreateResult::success(std::move(session));
}

ErrorInfo InferenceSession::initializeSession() {
    try {
        env_ = std::make_unique<Ort::Env>(
            onnx::toOrtLoggingLevel(config_.log_level), config_.log_id.c_str());

        Ort::SessionOptions session_options;
        if (config_.num_threads > 0) {
            session_options.SetIntraOpNumThreads(config_.num_threads);
        }
        if (config_.inter_op_threads > 0) {
            session_options.SetInterOpNumThreads(config_.inter_op_threads);
            session_options.SetExecutionMode(ExecutionMode::ORT_PARALLEL);
        }
        session_options.SetGraphOptimizationLevel(
            onnx::toOrtOptimizationLevel(config_.graph_optimization));

        if (!config_.enable_mem_arena) {
            session_options.DisableCpuMemArena();
        }
        if (!config_.enable_mem_pattern) {
            session_options.DisableMemPattern();
        }

        auto backend = ExecutionBackendFactory::create(config_);
        if (!backend) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Unknown backend: " + std::string(backendTypeToString(config_.backend)));
        }

        auto err = backend->apply(session_options);
        if (!err.isOk()) {
            if (!config_.fallback_to_cpu || config_.backend == BackendType::CPU) {
                return err;
            }
            std::cout << "[InferenceSession] " << err.message
                    << ", falling back to CPU" << std::endl;
            backend = std::make_unique<onnx::CpuBackend>();
        }
        provider_name_ = backend->getProviderName();

        session_ = std::make_unique<Ort::Session>(*env_, config_.model_path.c_str(), session_options);

        readMetadata();
        return ErrorInfo::ok();
    } catch (const Ort::Exception& e) {
        session_.reset();
        env_.reset();
        return fromOrtException(e, ErrorCode::INVALID_MODEL,
            "Failed to load model " + config_.model_path);
    }
}

void InferenceSession::readMetadata() {
    Ort::AllocatorWithDefaultOptions allocator;

    size_t num_inputs = session_->GetInputCount();
    inputs_.reserve(num_inputs);
    for (size_t i = 0; i < num_inputs; ++i) {
        auto name = session_->GetInputNameAllocated(i, allocator);
        inputs_.push_back(readTensorInfo(name.get(), session_->GetInputTypeInfo(i)));
    }

    size_t num_outputs = session_->GetOutputCount();
    outputs_.reserve(num_outputs);
    for (size_t i = 0; i < num_outputs; ++i) {
        auto name = session_->GetOutputNameAllocated(i, allocator);
        outputs_.push_back(readTensorInfo(name.get(), session_->GetOutputTypeInfo(i)));
    }

    if (config_.verbose) {
        for (const auto& in : inputs_) {
            std::cout << "[InferenceSession] input  " << in.name << " "
                    << shapeToString(in.shape) << std::endl;
        }
        for (const auto& out : outputs_) {
            std::cout << "[InferenceSession] output " << out.name << " "
                    << shapeToString(out.shape) << std::endl;
        }
    }
}

void InferenceSession::release() {
    std::lock_guard<std::mutex> lock(run_mutex_);

    if (released_.exchange(true)) {
        return;
    }

    session_.reset();
    env_.reset();
}

// =============================================================================
// Metadata
// =============================================================================

const TensorInfo* InferenceSession::findInput(const std::string& name) const {
    for (const auto& info : inputs_) {
        if (info.name == name) return &info;
    }
    return nullptr;
}

const TensorInfo* InferenceSession::findOutput(const std::string& name) const {
    for (const auto& info : outputs_) {
        if (info.name == name) return &info;
    }
    return nullptr;
}

InferenceStats InferenceSession::getLastStats() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return last_stats_;
}

// =============================================================================
// Validation
// =============================================================================

ErrorInfo InferenceSession::validateInputShape(const TensorInfo& info, const Shape& shape) const {
    for (int64_t dim : shape) {
        if (dim < 0) {
            return ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
                "Negative dimension in shape for input '" + info.name + "'",
                shapeToString(shape));
        }
    }

    if (info.element_type != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Input '" + info.name + "' is not a float tensor",
            "element type " + std::to_string(info.element_type));
    }

    if (shape.size() != info.shape.size()) {
        return ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
            "Rank mismatch for input '" + info.name + "'",
            "model expects " + shapeToString(info.shape) + ", got " + shapeToString(shape));
    }

    for (size_t i = 0; i < shape.size(); ++i) {
        if (info.shape[i] >= 0 && info.shape[i] != shape[i]) {
            return ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
                "Dimension " + std::to_string(i) + " mismatch for input '" + info.name + "'",
                "model expects " + shapeToString(info.shape) + ", got " + shapeToString(shape));
        }
    }

    size_t count = 0;
    if (!checkedElementCount(shape, count)) {
        return ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
            "Element count overflows for input '" + info.name + "'",
            shapeToString(shape));
    }

    return ErrorInfo::ok();
}

ErrorInfo InferenceSession::validateInput(const TensorView& input) const {
    const TensorInfo* info = findInput(input.name);
    if (!info) {
        return ErrorInfo::error(ErrorCode::UNKNOWN_TENSOR,
            "Unknown input tensor: '" + input.name + "'");
    }

    auto err = validateInputShape(*info, input.shape);
    if (!err.isOk()) {
        return err;
    }

    if (!input.data && input.elementCount() > 0) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Null data for input '" + input.name + "'");
    }

    return ErrorInfo::ok();
}

// =============================================================================
// Inference
// =============================================================================

Result<std::vector<Tensor>> InferenceSession::run(const std::vector<TensorView>& inputs,
                                                  const std::vector<std::string>& output_names) {
    using RunResult = Result<std::vector<Tensor>>;

    std::lock_guard<std::mutex> lock(run_mutex_);

    if (released_.load() || !session_) {
        return RunResult::failure(ErrorInfo::error(ErrorCode::INVALID_HANDLE,
            "Session has been released"));
    }

    if (output_names.empty()) {
        return RunResult::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "At least one output name is required"));
    }

    for (const auto& input : inputs) {
        auto err = validateInput(input);
        if (!err.isOk()) {
            return RunResult::failure(err);
        }
    }

    for (const auto& declared : inputs_) {
        bool bound = false;
        for (const auto& input : inputs) {
            if (input.name == declared.name) {
                bound = true;
                break;
            }
        }
        if (!bound) {
            return RunResult::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                "Missing model input: '" + declared.name + "'"));
        }
    }

    for (const auto& name : output_names) {
        if (!findOutput(name)) {
            return RunResult::failure(ErrorInfo::error(ErrorCode::UNKNOWN_TENSOR,
                "Unknown output tensor: '" + name + "'"));
        }
    }

    auto total_start = std::chrono::steady_clock::now();

    try {
        std::vector<const char*> input_names;
        std::vector<Ort::Value> input_values;
        input_names.reserve(inputs.size());
        input_values.reserve(inputs.size());

        for (const auto& input : inputs) {
            input_names.push_back(input.name.c_str());
            input_values.push_back(Ort::Value::CreateTensor<float>(
                memory_info_, const_cast<float*>(input.data), input.elementCount(),
                input.shape.data(), input.shape.size()));
        }

        std::vector<const char*> out_names;
        out_names.reserve(output_names.size());
        for (const auto& name : output_names) {
            out_names.push_back(name.c_str());
        }

        auto inf_start = std::chrono::steady_clock::now();
        auto outputs = session_->Run(
            Ort::RunOptions{nullptr},
            input_names.data(), input_values.data(), input_values.size(),
            out_names.data(), out_names.size());
        auto inf_end = std::chrono::steady_clock::now();

        std::vector<Tensor> results;
        results.reserve(outputs.size());

        for (size_t i = 0; i < outputs.size(); ++i) {
            if (!outputs[i].IsTensor()) {
                return RunResult::failure(ErrorInfo::error(ErrorCode::INFERENCE_FAILED,
                    "Output '" + output_names[i] + "' is not a tensor"));
            }

            auto info = outputs[i].GetTensorTypeAndShapeInfo();
            if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
                return RunResult::failure(ErrorInfo::error(ErrorCode::INFERENCE_FAILED,
                    "Output '" + output_names[i] + "' is not a float tensor"));
            }

            Tensor tensor;
            tensor.name = output_names[i];
            tensor.shape = info.GetShape();

            size_t count = info.GetElementCount();
            const float* src = outputs[i].GetTensorData<float>();
            tensor.data.assign(src, src + count);

            results.push_back(std::move(tensor));
        }

        auto total_end = std::chrono::steady_clock::now();

        last_stats_.inference_time_ms =
            std::chrono::duration<double, std::milli>(inf_end - inf_start).count();
        last_stats_.copy_time_ms =
            std::chrono::duration<double, std::milli>(total_end - inf_end).count();
        last_stats_.total_time_ms =
            std::chrono::duration<double, std::milli>(total_end - total_start).count();
        ++last_stats_.run_count;

        if (config_.verbose) {
            printStats();
        }

        return RunResult::success(std::move(results));
    } catch (const Ort::Exception& e) {
        return RunResult::failure(fromOrtException(e, ErrorCode::INFERENCE_FAILED,
            "ONNX Runtime execution failed"));
    } catch (const std::bad_alloc& e) {
        return RunResult::failure(ErrorInfo::error(ErrorCode::OUT_OF_MEMORY,
            "Out of memory during inference", e.what()));
    }
}

Result<Tensor> InferenceSession::run(const TensorView& input, const std::string& output_name) {
    auto result = run(std::vector<TensorView>{input}, std::vector<std::string>{output_name});
    if (!result.isOk()) {
        return Result<Tensor>::failure(result.error);
    }
    return Result<Tensor>::success(std::move(result.value.front()));
}

Result<Tensor> InferenceSession::run(const std::string& input_name, const float* data,
                                     const Shape& shape, const std::string& output_name) {
    TensorView view;
    view.name = input_name;
    view.data = data;
    view.shape = shape;
    return run(view, output_name);
}

Result<Shape> InferenceSession::runInto(const TensorView& input, const std::string& output_name,
                                        float* output, size_t capacity) {
    if (!output && capacity > 0) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Null output buffer"));
    }

    auto result = run(input, output_name);
    if (!result.isOk()) {
        return Result<Shape>::failure(result.error);
    }

    const Tensor& tensor = result.value;
    if (tensor.elementCount() > capacity) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::BUFFER_TOO_SMALL,
            "Output buffer too small for '" + output_name + "'",
            "need " + std::to_string(tensor.elementCount()) +
            " floats, capacity " + std::to_string(capacity)));
    }

    if (tensor.elementCount() > 0) {
        std::memcpy(output, tensor.data.data(), tensor.elementCount() * sizeof(float));
    }
    return Result<Shape>::success(tensor.shape);
}

// =============================================================================
// Output size queries
// =============================================================================

bool InferenceSession::resolveFromMetadata(const TensorInfo& input, const Shape& input_shape,
                                           const TensorInfo& output, Shape& resolved) const {
    resolved.clear();
    resolved.reserve(output.shape.size());

    for (size_t i = 0; i < output.shape.size(); ++i) {
        if (output.shape[i] >= 0) {
            resolved.push_back(output.shape[i]);
            continue;
        }

        const std::string& symbol =
            i < output.symbolic_dims.size() ? output.symbolic_dims[i] : std::string();
        if (symbol.empty()) {
            return false;
        }

        bool found = false;
        for (size_t j = 0; j < input.symbolic_dims.size() && j < input_shape.size(); ++j) {
            if (input.symbolic_dims[j] == symbol) {
                resolved.push_back(input_shape[j]);
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }

    return true;
}

Result<Shape> InferenceSession::getOutputShape(const Shape& input_shape,
                                               const std::string& output_name) {
    if (released_.load()) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::INVALID_HANDLE,
            "Session has been released"));
    }

    if (inputs_.empty()) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::INVALID_MODEL,
            "Model declares no inputs"));
    }

    if (inputs_.size() > 1) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Model has " + std::to_string(inputs_.size()) +
            " inputs; an input name is required"));
    }

    return getOutputShape(inputs_.front().name, input_shape, output_name);
}

Result<Shape> InferenceSession::getOutputShape(const std::string& input_name,
                                               const Shape& input_shape,
                                               const std::string& output_name) {
    if (released_.load()) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::INVALID_HANDLE,
            "Session has been released"));
    }

    const TensorInfo* input = findInput(input_name);
    if (!input) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::UNKNOWN_TENSOR,
            "Unknown input tensor: '" + input_name + "'"));
    }

    const TensorInfo* output = findOutput(output_name);
    if (!output) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::UNKNOWN_TENSOR,
            "Unknown output tensor: '" + output_name + "'"));
    }

    auto err = validateInputShape(*input, input_shape);
    if (!err.isOk()) {
        return Result<Shape>::failure(err);
    }

    Shape resolved;
    if (!resolveFromMetadata(*input, input_shape, *output, resolved)) {
        if (inputs_.size() > 1) {
            return Result<Shape>::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                "Output '" + output_name + "' has data-dependent dimensions; "
                "dry run needs a single-input model"));
        }

        std::string key = cacheKey(input_name, input_shape, output_name);
        if (!lookupCachedShape(key, resolved)) {
            // Dry run on zero-filled input
            std::vector<float> zeros;
            try {
                zeros.assign(shapeElementCount(input_shape), 0.0f);
            } catch (const std::bad_alloc& e) {
                return Result<Shape>::failure(ErrorInfo::error(ErrorCode::OUT_OF_MEMORY,
                    "Cannot allocate dry-run input " + shapeToString(input_shape), e.what()));
            } catch (const std::length_error& e) {
                return Result<Shape>::failure(ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
                    "Dry-run input too large " + shapeToString(input_shape), e.what()));
            }

            auto dry = run(input_name, zeros.data(), input_shape, output_name);
            if (!dry.isOk()) {
                return Result<Shape>::failure(dry.error);
            }
            resolved = dry.value.shape;
            storeCachedShape(key, resolved);
        }
    }

    size_t count = 0;
    if (!checkedElementCount(resolved, count)) {
        return Result<Shape>::failure(ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
            "Element count overflows for output '" + output_name + "'",
            shapeToString(resolved)));
    }

    return Result<Shape>::success(resolved);
}

Result<size_t> InferenceSession::getOutputSize(const Shape& input_shape,
                                               const std::string& output_name) {
    auto shape = getOutputShape(input_shape, output_name);
    if (!shape.isOk()) {
        return Result<size_t>::failure(shape.error);
    }
    return Result<size_t>::success(shapeElementCount(shape.value));
}

// =============================================================================
// Output shape cache
// =============================================================================

std::string InferenceSession::cacheKey(const std::string& input_name, const Shape& input_shape,
                                       const std::string& output_name) const {
    return input_name + "|" + output_name + "|" + shapeToString(input_shape);
}

bool InferenceSession::lookupCachedShape(const std::string& key, Shape& shape) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = output_shape_cache_.find(key);
    if (it == output_shape_cache_.end()) {
        return false;
    }
    output_shape_lru_.splice(output_shape_lru_.begin(), output_shape_lru_, it->second);
    shape = it->second->second;
    return true;
}

void InferenceSession::storeCachedShape(const std::string& key, const Shape& shape) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = output_shape_cache_.find(key);
    if (it != output_shape_cache_.end()) {
        it->second->second = shape;
        output_shape_lru_.splice(output_shape_lru_.begin(), output_shape_lru_, it->second);
        return;
    }

    output_shape_lru_.emplace_front(key, shape);
    output_shape_cache_[key] = output_shape_lru_.begin();

    if (output_shape_lru_.size() > OUTPUT_SHAPE_CACHE_CAPACITY) {
        output_shape_cache_.erase(output_shape_lru_.back().first);
        output_shape_lru_.pop_back();
    }
}

size_t InferenceSession::cachedShapeCount() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return output_shape_lru_.size();
}

// =============================================================================
// Logging
// =============================================================================

void InferenceSession::printStats() const {
    std::cout << "[InferenceSession] run #" << last_stats_.run_count
            << " inference " << std::fixed << std::setprecision(2)
            << last_stats_.inference_time_ms << " ms, copy "
            << last_stats_.copy_time_ms << " ms, total "
            << last_stats_.total_time_ms << " ms" << std::endl;
}

}  // namespace infer
