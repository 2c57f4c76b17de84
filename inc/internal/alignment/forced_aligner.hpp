/**
 * @file forced_aligner.hpp
 * @brief CTC forced alignment of a known transcript to audio
 *
 * Uses an MMS-FA style acoustic model (input [1, samples] at 16 kHz,
 * output [1, frames, vocab]) through InferenceSession, then finds the
 * best CTC path through a Viterbi trellis to obtain word timestamps.
 */

#ifndef INFER_ALIGN_FORCED_ALIGNER_HPP
#define INFER_ALIGN_FORCED_ALIGNER_HPP

#include <memory>
#include <string>
#include <vector>

#include "../infer_types.hpp"
#include "../inference_session.hpp"
#include "alignment_types.hpp"
#include "ctc_tokenizer.hpp"

namespace infer {
namespace align {

/**
 * @class ForcedAligner
 * @brief Word-level timestamps from audio plus its known transcript
 *
 * Example usage:
 * @code
 *   infer::align::ForcedAligner aligner;
 *   auto err = aligner.initialize();
 *   if (!err.isOk()) { ... }
 *
 *   auto result = aligner.alignFile("speech.wav", "hello world");
 *   for (const auto& w : result.value.words) {
 *       std::cout << w.text << " " << w.start_time << std::endl;
 *   }
 * @endcode
 */
class ForcedAligner {
public:
    ForcedAligner();
    explicit ForcedAligner(const AlignerConfig& config);
    ~ForcedAligner();

    // Non-copyable
    ForcedAligner(const ForcedAligner&) = delete;
    ForcedAligner& operator=(const ForcedAligner&) = delete;

    // -------------------------------------------------------------------------
    // Initialization
    // -------------------------------------------------------------------------

    /**
     * @brief Load labels and create the inference session from config.model_dir
     *
     * Missing files are downloaded when config.base_url is set.
     */
    ErrorInfo initialize();

    /// @brief Tokenizer only; alignEmissions() works, align() does not.
    /// Rejects a non-positive sample_rate or hop_size like initialize().
    ErrorInfo initializeWithLabels(const std::vector<std::string>& labels);

    bool isInitialized() const { return tokenizer_ != nullptr; }
    bool hasSession() const { return session_ != nullptr; }

    const CtcTokenizer* getTokenizer() const { return tokenizer_.get(); }
    const AlignerConfig& getConfig() const { return config_; }

    // -------------------------------------------------------------------------
    // Alignment
    // -------------------------------------------------------------------------

    /**
     * @brief Align a transcript to 16 kHz mono samples
     */
    Result<AlignmentResult> align(const std::vector<float>& audio, const std::string& transcript);

    /**
     * @brief Align a transcript to an audio file
     *
     * Multi-channel audio is downmixed; sample rates other than
     * config.sample_rate are rejected with UNSUPPORTED_FORMAT.
     */
    Result<AlignmentResult> alignFile(const std::string& path, const std::string& transcript);

    /**
     * @brief Align a transcript to precomputed log-probabilities
     * @param emissions [frames x vocab] log-probabilities
     * @param total_duration Audio duration in seconds; 0 = frames x hop / rate
     */
    Result<AlignmentResult> alignEmissions(const Emissions& emissions,
        const std::string& transcript, double total_duration = 0.0) const;

    /// @brief Run the acoustic model, returning [frames x vocab] (log-softmaxed per config)
    Result<Emissions> computeEmissions(const std::vector<float>& audio);

    // -------------------------------------------------------------------------
    // CTC primitives
    // -------------------------------------------------------------------------

    /**
     * @brief Viterbi trellis over states [blank, t0, blank, t1, ..., blank]
     *
     * Transitions: stay, advance by one, or skip the blank between two
     * different tokens. Empty tokens yield one empty row per frame; any
     * out-of-vocabulary token yields an empty trellis.
     */
    Trellis buildTrellis(const Emissions& emissions, const std::vector<int>& tokens) const;

    /**
     * @brief Best path through the trellis, merged into per-token spans
     *
     * A span ends on the frame before the next token starts, so trailing
     * blanks belong to the preceding token. The last span ends on the last frame.
     */
    std::vector<TokenSpan> backtrack(const Trellis& trellis, const std::vector<int>& tokens) const;

    /// @brief In-place log-softmax of every frame
    static void logSoftmax(Emissions& emissions);

    /// @brief Load a mono float buffer from an audio file
    static Result<std::vector<float>> loadAudio(const std::string& path, int expected_sample_rate);

private:
    // sample_rate 与 hop_size 必须为正, 帧到秒的换算依赖二者
    ErrorInfo validateConfig() const;

    AlignerConfig config_;

    std::unique_ptr<CtcTokenizer> tokenizer_;
    std::unique_ptr<InferenceSession> session_;
    std::string input_name_;
    std::string output_name_;
};

}  // namespace align
}  // namespace infer

#endif  // INFER_ALIGN_FORCED_ALIGNER_HPP
