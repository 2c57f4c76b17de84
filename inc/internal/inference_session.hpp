/**
 * @file inference_session.hpp
 * @brief InferenceSession - one loaded ONNX model plus its execution context
 *
 * Owns the ONNX Runtime environment, session options and session for a
 * single model file, and exposes float tensor inference with explicit
 * per-call results instead of sentinel values.
 */

#ifndef INFER_INFERENCE_SESSION_HPP
#define INFER_INFERENCE_SESSION_HPP

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "infer_types.hpp"
#include "infer_config.hpp"
#include "backends/execution_backend.hpp"
#include "backends/onnx/onnx_compat.hpp"

namespace infer {

/**
 * @class InferenceSession
 * @brief ONNX Runtime session wrapper for float tensor inference
 *
 * Example usage:
 * @code
 *   auto created = infer::InferenceSession::create(
 *       infer::SessionConfig::cpu("model.onnx", 2));
 *   if (!created) {
 *       std::cerr << created.error.describe() << std::endl;
 *       return;
 *   }
 *   auto& session = created.value;
 *
 *   std::vector<float> audio(16000, 0.0f);
 *   auto out = session->run("input", audio.data(), {1, 16000}, "logits");
 *   if (out) {
 *       std::cout << infer::shapeToString(out.value.shape) << std::endl;
 *   }
 * @endcode
 *
 * Input names, ranks, fixed dimensions and output names are checked against
 * the model metadata before native execution. Calls on one session are
 * serialised internally; distinct sessions run independently.
 */
class InferenceSession {
    // 只有 create() 能构造
    struct PrivateTag {};

public:
    static constexpr size_t OUTPUT_SHAPE_CACHE_CAPACITY = 32;

    /**
     * @brief Load a model and build its execution context
     * @param config Session configuration
     * @return Owned session, or the reason creation failed
     */
    static Result<std::unique_ptr<InferenceSession>> create(const SessionConfig& config);

    InferenceSession(PrivateTag, const SessionConfig& config);
    ~InferenceSession();

    // Non-copyable
    InferenceSession(const InferenceSession&) = delete;
    InferenceSession& operator=(const InferenceSession&) = delete;

    // -------------------------------------------------------------------------
    // Inference
    // -------------------------------------------------------------------------

    /**
     * @brief Run one forward pass with several inputs and outputs
     * @param inputs Bound inputs (every model input must be present)
     * @param output_names Requested outputs, in result order
     */
    Result<std::vector<Tensor>> run(const std::vector<TensorView>& inputs,
        const std::vector<std::string>& output_names);

    /**
     * @brief Run one forward pass with a single input and output
     */
    Result<Tensor> run(const TensorView& input, const std::string& output_name);

    Result<Tensor> run(const std::string& input_name, const float* data,
        const Shape& shape, const std::string& output_name);

    /**
     * @brief Run and copy the output into a caller buffer
     * @param output Destination buffer
     * @param capacity Number of floats the buffer holds
     * @return Output shape; BUFFER_TOO_SMALL if capacity is insufficient
     *         (nothing is written in that case)
     */
    Result<Shape> runInto(const TensorView& input, const std::string& output_name,
        float* output, size_t capacity);

    // -------------------------------------------------------------------------
    // Output size queries
    // -------------------------------------------------------------------------

    /**
     * @brief Shape of an output for a hypothetical input shape
     *
     * Resolved from model metadata when every output dim is fixed or shares a
     * symbolic name with an input dim; otherwise a zero-filled dry run is used.
     * Dry-run results are memoised per (input, output, shape), keeping the
     * OUTPUT_SHAPE_CACHE_CAPACITY most recently used entries.
     *
     * Shapes whose element count overflows fail with SHAPE_MISMATCH.
     *
     * @param input_shape Shape bound to the (sole or first) model input
     * @param output_name Output tensor name
     */
    Result<Shape> getOutputShape(const Shape& input_shape, const std::string& output_name);

    Result<Shape> getOutputShape(const std::string& input_name, const Shape& input_shape,
        const std::string& output_name);

    /// @brief Element count of getOutputShape(); 0 is a valid success value
    Result<size_t> getOutputSize(const Shape& input_shape, const std::string& output_name);

    // -------------------------------------------------------------------------
    // Metadata & status
    // -------------------------------------------------------------------------

    const std::vector<TensorInfo>& getInputs() const { return inputs_; }
    const std::vector<TensorInfo>& getOutputs() const { return outputs_; }

    const TensorInfo* findInput(const std::string& name) const;
    const TensorInfo* findOutput(const std::string& name) const;

    const SessionConfig& getConfig() const { return config_; }

    /// @brief Provider actually used ("CPUExecutionProvider", "CUDAExecutionProvider", ...)
    std::string getProviderName() const { return provider_name_; }

    /// @brief Stats of the most recent run
    InferenceStats getLastStats() const;

    /**
     * @brief Release all native resources; idempotent
     *
     * Later calls fail with INVALID_HANDLE.
     */
    void release();

    bool isReleased() const { return released_.load(); }

    /// @brief Number of memoised dry-run output shapes
    size_t cachedShapeCount() const;

private:
    std::string cacheKey(const std::string& input_name, const Shape& input_shape,
        const std::string& output_name) const;
    bool lookupCachedShape(const std::string& key, Shape& shape);
    void storeCachedShape(const std::string& key, const Shape& shape);

    SessionConfig config_;
    std::atomic<bool> released_{false};

    // ONNX Runtime components
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo memory_info_;
    std::string provider_name_;

    // Model metadata
    std::vector<TensorInfo> inputs_;
    std::vector<TensorInfo> outputs_;

    mutable std::mutex run_mutex_;
    InferenceStats last_stats_;

    // 干跑结果的 LRU 缓存, 表头为最近使用
    using CacheEntry = std::pair<std::string, Shape>;
    mutable std::mutex cache_mutex_;
    std::list<CacheEntry> output_shape_lru_;
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> output_shape_cache_;

    // Internal methods
    ErrorInfo initializeSession();
    void readMetadata();

    ErrorInfo validateInput(const TensorView& input) const;
    ErrorInfo validateInputShape(const TensorInfo& info, const Shape& shape) const;

    bool resolveFromMetadata(const TensorInfo& input, const Shape& input_shape,
        const TensorInfo& output, Shape& resolved) const;

    void printStats() const;
};

}  // namespace infer

#endif  // INFER_INFERENCE_SESSION_HPP
