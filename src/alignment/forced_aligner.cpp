/**
 * @file forced_aligner.cpp
 * @brief CTC forced alignment implementation
 */

#include "alignment/forced_aligner.hpp"
#include "alignment/model_loader.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace infer {
namespace align {

namespace {

constexpr float NEG_INF = -std::numeric_limits<float>::infinity();

struct TranscriptWord {
    std::string text;
    size_t offset = 0;
};

std::vector<TranscriptWord> splitWords(const std::string& transcript) {
    std::vector<TranscriptWord> words;
    size_t i = 0;
    while (i < transcript.size()) {
        while (i < transcript.size() && std::isspace(static_cast<unsigned char>(transcript[i]))) {
            ++i;
        }
        if (i >= transcript.size()) {
            break;
        }
        size_t start = i;
        while (i < transcript.size() && !std::isspace(static_cast<unsigned char>(transcript[i]))) {
            ++i;
        }
        words.push_back({transcript.substr(start, i - start), start});
    }
    return words;
}

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

ForcedAligner::ForcedAligner()
    : config_(AlignerConfig{})
{
}

ForcedAligner::ForcedAligner(const AlignerConfig& config)
    : config_(config)
{
}

ForcedAligner::~ForcedAligner() = default;

ErrorInfo ForcedAligner::validateConfig() const {
    if (config_.sample_rate <= 0 || config_.hop_size <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "sample_rate and hop_size must be positive",
            "sample_rate=" + std::to_string(config_.sample_rate) +
            " hop_size=" + std::to_string(config_.hop_size));
    }
    return ErrorInfo::ok();
}

ErrorInfo ForcedAligner::initialize() {
    auto config_error = validateConfig();
    if (!config_error.isOk()) {
        return config_error;
    }

    ModelLoader::Config loader_config;
    loader_config.model_dir = config_.model_dir;
    loader_config.base_url = config_.base_url;
    loader_config.model_file = config_.model_file;
    loader_config.labels_file = config_.labels_file;

    ModelLoader loader(loader_config);
    auto err = loader.ensureModelsExist();
    if (!err.isOk()) {
        return err;
    }

    auto tokenizer = CtcTokenizer::fromFile(loader.getModelPath(config_.labels_file));
    if (!tokenizer.isOk()) {
        return tokenizer.error;
    }

    std::string model_path = loader.getModelPath(config_.model_file);
    SessionConfig session_config = config_.use_accelerator
        ? SessionConfig::accelerated(model_path, config_.num_threads).withCpuFallback()
        : SessionConfig::cpu(model_path, config_.num_threads);

    auto created = InferenceSession::create(session_config);
    if (!created.isOk()) {
        return created.error;
    }

    auto& session = created.value;
    if (session->getInputs().empty() || session->getOutputs().empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_MODEL,
            "Alignment model must have at least one input and one output");
    }

    std::string input_name = config_.input_name.empty()
        ? session->getInputs().front().name : config_.input_name;
    std::string output_name = config_.output_name.empty()
        ? session->getOutputs().front().name : config_.output_name;

    if (!session->findInput(input_name)) {
        return ErrorInfo::error(ErrorCode::UNKNOWN_TENSOR,
            "Alignment model has no input '" + input_name + "'");
    }
    if (!session->findOutput(output_name)) {
        return ErrorInfo::error(ErrorCode::UNKNOWN_TENSOR,
            "Alignment model has no output '" + output_name + "'");
    }

    tokenizer_ = std::make_unique<CtcTokenizer>(std::move(tokenizer.value));
    session_ = std::move(session);
    input_name_ = input_name;
    output_name_ = output_name;

    std::cout << "[ForcedAligner] Initialized with vocab size: "
            << tokenizer_->vocabSize() << std::endl;
    return ErrorInfo::ok();
}

ErrorInfo ForcedAligner::initializeWithLabels(const std::vector<std::string>& labels) {
    auto config_error = validateConfig();
    if (!config_error.isOk()) {
        return config_error;
    }
    if (labels.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Label list is empty");
    }
    tokenizer_ = std::make_unique<CtcTokenizer>(labels);
    return ErrorInfo::ok();
}

// =============================================================================
// CTC Trellis
// =============================================================================

Trellis ForcedAligner::buildTrellis(const Emissions& emissions, const std::vector<int>& tokens) const {
    if (!tokenizer_) {
        return {};
    }
    if (emissions.empty() || emissions[0].empty()) {
        return {};
    }

    const size_t num_frames = emissions.size();
    const size_t num_tokens = tokens.size();
    const int vocab_size = static_cast<int>(emissions[0].size());

    if (num_tokens == 0) {
        return Trellis(num_frames);
    }

    const int blank = tokenizer_->blankIndex();
    if (blank < 0 || blank >= vocab_size) {
        return {};
    }
    for (int token : tokens) {
        if (token < 0 || token >= vocab_size) {
            return {};
        }
    }
    for (const auto& frame : emissions) {
        if (static_cast<int>(frame.size()) != vocab_size) {
            return {};
        }
    }

    const size_t num_states = 2 * num_tokens + 1;   // blank, t0, blank, t1, ..., blank
    Trellis trellis(num_frames, std::vector<float>(num_states, NEG_INF));

    // 起始于第一个 blank 或第一个 token
    trellis[0][0] = emissions[0][blank];
    trellis[0][1] = emissions[0][tokens[0]];

    for (size_t t = 1; t < num_frames; ++t) {
        const auto& prev = trellis[t - 1];
        auto& row = trellis[t];

        for (size_t s = 0; s < num_states; ++s) {
            const bool is_blank = (s % 2 == 0);
            const size_t token_idx = s / 2;
            const float emit = is_blank ? emissions[t][blank] : emissions[t][tokens[token_idx]];

            float best = prev[s];
            if (s > 0) {
                best = std::max(best, prev[s - 1]);
            }
            // 不同 token 之间可以跳过 blank
            if (s > 1 && !is_blank && tokens[token_idx] != tokens[token_idx - 1]) {
                best = std::max(best, prev[s - 2]);
            }

            row[s] = best + emit;
        }
    }

    return trellis;
}

std::vector<TokenSpan> ForcedAligner::backtrack(const Trellis& trellis,
                                                const std::vector<int>& tokens) const {
    if (trellis.empty() || tokens.empty() || trellis[0].empty()) {
        return {};
    }

    const size_t num_frames = trellis.size();
    const size_t num_states = trellis[0].size();

    // 终止于最后一个 blank 或最后一个 token
    size_t state = num_states - 1;
    if (num_states >= 2 && trellis[num_frames - 1][num_states - 2] > trellis[num_frames - 1][num_states - 1]) {
        state = num_states - 2;
    }

    std::vector<size_t> path(num_frames);
    path[num_frames - 1] = state;

    for (size_t t = num_frames - 1; t > 0; --t) {
        const auto& prev = trellis[t - 1];
        size_t best_state = state;
        float best_score = NEG_INF;

        if (state < prev.size() && prev[state] > best_score) {
            best_state = state;
            best_score = prev[state];
        }

        if (state > 0 && state - 1 < prev.size() && prev[state - 1] > best_score) {
            best_state = state - 1;
            best_score = prev[state - 1];
        }

        if (state > 1 && state - 2 < prev.size() && state % 2 == 1) {
            size_t token_idx = state / 2;
            if (token_idx < tokens.size() && tokens[token_idx] != tokens[token_idx - 1] &&
                prev[state - 2] > best_score) {
                best_state = state - 2;
                best_score = prev[state - 2];
            }
        }

        state = best_state;
        path[t - 1] = state;
    }

    // 合并连续帧为 token 区间
    std::vector<TokenSpan> spans;
    int current = -1;
    int span_start = 0;

    for (size_t frame = 0; frame < path.size(); ++frame) {
        size_t s = path[frame];
        if (s % 2 == 0) {
            continue;
        }
        int token_idx = static_cast<int>(s / 2);
        if (token_idx == current || token_idx >= static_cast<int>(tokens.size())) {
            continue;
        }
        if (current >= 0) {
            spans.push_back({current, tokens[current], span_start,
                std::max(0, static_cast<int>(frame) - 1)});
        }
        current = token_idx;
        span_start = static_cast<int>(frame);
    }

    if (current >= 0) {
        spans.push_back({current, tokens[current], span_start,
            static_cast<int>(num_frames) - 1});
    }

    return spans;
}

void ForcedAligner::logSoftmax(Emissions& emissions) {
    for (auto& frame : emissions) {
        if (frame.empty()) {
            continue;
        }
        float max_val = *std::max_element(frame.begin(), frame.end());
        double sum = 0.0;
        for (float v : frame) {
            sum += std::exp(static_cast<double>(v - max_val));
        }
        float log_sum = max_val + static_cast<float>(std::log(sum));
        for (auto& v : frame) {
            v -= log_sum;
        }
    }
}

// =============================================================================
// Alignment
// =============================================================================

Result<AlignmentResult> ForcedAligner::alignEmissions(const Emissions& emissions,
                                                      const std::string& transcript,
                                                      double total_duration) const {
    using AlignResult = Result<AlignmentResult>;

    if (!tokenizer_) {
        return AlignResult::failure(ErrorInfo::error(ErrorCode::INVALID_HANDLE,
            "Aligner not initialized"));
    }
    if (emissions.empty() || emissions[0].empty()) {
        return AlignResult::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "No emission frames"));
    }

    const double frame_duration = config_.frameDuration();
    const size_t num_frames = emissions.size();

    // 词序列 -> token 序列, 记录每个 token 属于哪个词 (-1 = 词间分隔符)
    auto words = splitWords(transcript);
    std::vector<int> tokens;
    std::vector<int> owner;
    auto space = tokenizer_->spaceIndex();

    for (size_t w = 0; w < words.size(); ++w) {
        auto word_tokens = tokenizer_->tokenize(words[w].text, false);
        if (word_tokens.empty()) {
            continue;
        }
        if (!tokens.empty() && config_.include_spaces && space) {
            tokens.push_back(*space);
            owner.push_back(-1);
        }
        for (int token : word_tokens) {
            tokens.push_back(token);
            owner.push_back(static_cast<int>(w));
        }
    }

    std::vector<TokenSpan> spans;
    if (!tokens.empty()) {
        auto trellis = buildTrellis(emissions, tokens);
        if (trellis.empty()) {
            return AlignResult::failure(ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
                "Emissions do not cover the tokenizer vocabulary",
                "vocab " + std::to_string(emissions[0].size()) +
                ", labels " + std::to_string(tokenizer_->vocabSize())));
        }

        const auto& last = trellis.back();
        float final_score = last.back();
        if (last.size() >= 2) {
            final_score = std::max(final_score, last[last.size() - 2]);
        }
        if (std::isinf(final_score) && final_score < 0) {
            return AlignResult::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                "Audio too short for transcript",
                std::to_string(tokens.size()) + " tokens, " +
                std::to_string(num_frames) + " frames"));
        }

        spans = backtrack(trellis, tokens);
    }

    AlignmentResult result;
    result.num_frames = num_frames;
    result.total_duration = total_duration > 0.0
        ? total_duration : static_cast<double>(num_frames) * frame_duration;
    result.words.reserve(words.size());

    double prev_end = 0.0;
    for (size_t w = 0; w < words.size(); ++w) {
        WordTiming timing;
        timing.word_index = static_cast<int>(w);
        timing.text = words[w].text;
        timing.char_offset = words[w].offset;
        timing.char_length = words[w].text.size();

        int first = -1;
        int last = -1;
        double prob_sum = 0.0;
        int prob_count = 0;

        for (const auto& span : spans) {
            if (owner[span.token_index] != static_cast<int>(w)) {
                continue;
            }
            first = first < 0 ? span.start_frame : std::min(first, span.start_frame);
            last = std::max(last, span.end_frame);
            for (int f = span.start_frame; f <= span.end_frame; ++f) {
                prob_sum += std::exp(static_cast<double>(emissions[f][span.token]));
                ++prob_count;
            }
        }

        if (first < 0) {
            // 无可对齐字符: 零长度, 位于上一个词的结尾
            timing.start_time = prev_end;
            timing.duration = 0.0;
            timing.confidence = 0.0;
        } else {
            timing.start_time = first * frame_duration;
            timing.duration = (last + 1 - first) * frame_duration;
            timing.confidence = std::min(1.0, prob_sum / prob_count);
            prev_end = timing.endTime();
        }

        result.words.push_back(std::move(timing));
    }

    return AlignResult::success(std::move(result));
}

Result<Emissions> ForcedAligner::computeEmissions(const std::vector<float>& audio) {
    if (!session_) {
        return Result<Emissions>::failure(ErrorInfo::error(ErrorCode::INVALID_HANDLE,
            "Aligner has no inference session"));
    }
    if (audio.empty()) {
        return Result<Emissions>::failure(ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Audio is empty"));
    }

    const TensorInfo* input_info = session_->findInput(input_name_);
    Shape input_shape = {1, static_cast<int64_t>(audio.size())};
    if (input_info && input_info->shape.size() == 1) {
        input_shape = {static_cast<int64_t>(audio.size())};
    }

    auto output = session_->run(input_name_, audio.data(), input_shape, output_name_);
    if (!output.isOk()) {
        return Result<Emissions>::failure(output.error);
    }

    const Tensor& tensor = output.value;
    int64_t frames = 0;
    int64_t vocab = 0;
    if (tensor.rank() == 3 && tensor.shape[0] == 1) {
        frames = tensor.shape[1];
        vocab = tensor.shape[2];
    } else if (tensor.rank() == 2) {
        frames = tensor.shape[0];
        vocab = tensor.shape[1];
    } else {
        return Result<Emissions>::failure(ErrorInfo::error(ErrorCode::SHAPE_MISMATCH,
            "Unexpected emission shape", shapeToString(tensor.shape)));
    }

    Emissions emissions(static_cast<size_t>(frames));
    for (int64_t f = 0; f < frames; ++f) {
        auto begin = tensor.data.begin() + f * vocab;
        emissions[f].assign(begin, begin + vocab);
    }

    if (config_.apply_log_softmax) {
        logSoftmax(emissions);
    }

    return Result<Emissions>::success(std::move(emissions));
}

Result<AlignmentResult> ForcedAligner::align(const std::vector<float>& audio,
                                             const std::string& transcript) {
    auto emissions = computeEmissions(audio);
    if (!emissions.isOk()) {
        return Result<AlignmentResult>::failure(emissions.error);
    }

    double duration = static_cast<double>(audio.size()) / config_.sample_rate;
    return alignEmissions(emissions.value, transcript, duration);
}

Result<AlignmentResult> ForcedAligner::alignFile(const std::string& path,
                                                 const std::string& transcript) {
    auto audio = loadAudio(path, config_.sample_rate);
    if (!audio.isOk()) {
        return Result<AlignmentResult>::failure(audio.error);
    }
    return align(audio.value, transcript);
}

// =============================================================================
// Audio I/O
// =============================================================================

Result<std::vector<float>> ForcedAligner::loadAudio(const std::string& path,
                                                    int expected_sample_rate) {
    using AudioResult = Result<std::vector<float>>;

    SF_INFO sf_info;
    memset(&sf_info, 0, sizeof(sf_info));

    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &sf_info);
    if (!file) {
        return AudioResult::failure(ErrorInfo::error(ErrorCode::IO_ERROR,
            "Failed to open audio file: " + path,
            sf_strerror(nullptr)));
    }

    if (sf_info.samplerate != expected_sample_rate) {
        sf_close(file);
        return AudioResult::failure(ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Unsupported sample rate: " + std::to_string(sf_info.samplerate) + " Hz",
            "expected " + std::to_string(expected_sample_rate) + " Hz; resample before alignment"));
    }

    // Read audio data directly as float
    std::vector<float> audio_data(static_cast<size_t>(sf_info.frames) * sf_info.channels);
    sf_count_t samples_read = sf_read_float(file, audio_data.data(),
        static_cast<sf_count_t>(audio_data.size()));
    sf_close(file);

    if (samples_read <= 0) {
        return AudioResult::failure(ErrorInfo::error(ErrorCode::IO_ERROR,
            "Failed to read audio data from file", path));
    }
    audio_data.resize(static_cast<size_t>(samples_read));

    if (sf_info.channels == 1) {
        return AudioResult::success(std::move(audio_data));
    }

    // Downmix to mono
    const size_t frames = audio_data.size() / sf_info.channels;
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < sf_info.channels; ++ch) {
            sum += audio_data[i * sf_info.channels + ch];
        }
        mono[i] = sum / sf_info.channels;
    }

    return AudioResult::success(std::move(mono));
}

}  // namespace align
}  // namespace infer
