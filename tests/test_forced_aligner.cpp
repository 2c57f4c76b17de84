// test_forced_aligner.cpp
// Tests for infer::align::ForcedAligner
//
// Framework: doctest
// Runs with: ONNX Runtime CPU provider for the end-to-end cases
//
// These tests cover:
// - trellis construction and backtracking on hand-made emissions
// - word timings, confidence, unalignable words, too-short audio
// - AlignmentResult helpers
// - config checks on both initialize paths
// - initialize() + align() through a Reshape model that passes logits through
// - audio loading errors

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "alignment/forced_aligner.hpp"
#include "test_model_builder.hpp"

using namespace infer;
using namespace infer::align;

namespace {

// blank 0, a 1, b 2, space 3
const std::vector<std::string> SMALL_LABELS = {"-", "a", "b", "*"};

constexpr int BLANK = 0;
constexpr int A = 1;
constexpr int B = 2;
constexpr int SPACE = 3;

// One frame of log-probabilities where `dominant` takes almost all the mass
std::vector<float> frame(int dominant, int vocab = 4) {
    std::vector<float> row(vocab, std::log(0.01f));
    row[dominant] = std::log(0.97f);
    return row;
}

Emissions framesOf(const std::vector<int>& dominants, int vocab = 4) {
    Emissions emissions;
    for (int d : dominants) {
        emissions.push_back(frame(d, vocab));
    }
    return emissions;
}

// 16-bit PCM WAV
std::string writeWav(const std::string& name, int sample_rate, int channels,
                     const std::vector<int16_t>& samples) {
    auto u32 = [](std::string& s, uint32_t v) {
        for (int i = 0; i < 4; ++i) s.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    };
    auto u16 = [](std::string& s, uint16_t v) {
        s.push_back(static_cast<char>(v & 0xFF));
        s.push_back(static_cast<char>((v >> 8) & 0xFF));
    };

    const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
    std::string bytes = "RIFF";
    u32(bytes, 36 + data_size);
    bytes += "WAVEfmt ";
    u32(bytes, 16);
    u16(bytes, 1);
    u16(bytes, static_cast<uint16_t>(channels));
    u32(bytes, static_cast<uint32_t>(sample_rate));
    u32(bytes, static_cast<uint32_t>(sample_rate * channels * 2));
    u16(bytes, static_cast<uint16_t>(channels * 2));
    u16(bytes, 16);
    bytes += "data";
    u32(bytes, data_size);
    for (int16_t s : samples) {
        u16(bytes, static_cast<uint16_t>(s));
    }
    return testutil::writeFile(name, bytes);
}

}  // namespace

// ============================================================================
// CTC primitives
// ============================================================================

TEST_CASE("ForcedAligner - logSoftmax normalises each frame") {
    Emissions emissions = {{1.0f, 2.0f, 3.0f}, {0.0f, 0.0f}};
    ForcedAligner::logSoftmax(emissions);

    for (const auto& row : emissions) {
        double sum = 0.0;
        for (float v : row) {
            CHECK(v <= 0.0f);
            sum += std::exp(static_cast<double>(v));
        }
        CHECK(sum == doctest::Approx(1.0).epsilon(1e-5));
    }
    CHECK(emissions[0][2] - emissions[0][1] == doctest::Approx(1.0f).epsilon(1e-5));
    CHECK(emissions[1][0] == doctest::Approx(std::log(0.5f)).epsilon(1e-5));
}

TEST_CASE("ForcedAligner - trellis shape and edge cases") {
    ForcedAligner aligner;
    Emissions emissions = framesOf({A, A, BLANK, B});

    SUBCASE("requires a tokenizer") {
        CHECK(aligner.buildTrellis(emissions, {A, B}).empty());
    }

    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    SUBCASE("states are interleaved with blanks") {
        auto trellis = aligner.buildTrellis(emissions, {A, B});
        REQUIRE(trellis.size() == 4);
        CHECK(trellis[0].size() == 5);
        // frame 0 can only be in the leading blank or the first token
        CHECK(std::isfinite(trellis[0][0]));
        CHECK(std::isfinite(trellis[0][1]));
        CHECK(std::isinf(trellis[0][2]));
        CHECK(std::isinf(trellis[0][4]));
    }

    SUBCASE("no tokens gives empty rows") {
        auto trellis = aligner.buildTrellis(emissions, {});
        REQUIRE(trellis.size() == 4);
        CHECK(trellis[0].empty());
    }

    SUBCASE("out-of-vocabulary token") {
        CHECK(aligner.buildTrellis(emissions, {A, 10}).empty());
        CHECK(aligner.buildTrellis(emissions, {-1}).empty());
    }

    SUBCASE("ragged emissions") {
        Emissions ragged = emissions;
        ragged[2].pop_back();
        CHECK(aligner.buildTrellis(ragged, {A}).empty());
    }
}

TEST_CASE("ForcedAligner - backtrack produces token spans") {
    ForcedAligner aligner;
    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    std::vector<int> tokens = {A, SPACE, B};
    auto trellis = aligner.buildTrellis(framesOf({A, A, SPACE, B, B, BLANK}), tokens);
    auto spans = aligner.backtrack(trellis, tokens);

    REQUIRE(spans.size() == 3);
    CHECK(spans[0].token == A);
    CHECK(spans[0].start_frame == 0);
    CHECK(spans[0].end_frame == 1);
    CHECK(spans[0].frameCount() == 2);

    CHECK(spans[1].token == SPACE);
    CHECK(spans[1].start_frame == 2);
    CHECK(spans[1].end_frame == 2);

    // trailing blank belongs to the last token
    CHECK(spans[2].token == B);
    CHECK(spans[2].token_index == 2);
    CHECK(spans[2].start_frame == 3);
    CHECK(spans[2].end_frame == 5);

    CHECK(aligner.backtrack({}, tokens).empty());
}

TEST_CASE("ForcedAligner - repeated token needs a blank between") {
    ForcedAligner aligner;
    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    auto tooShort = aligner.alignEmissions(framesOf({A, A}), "aa");
    CHECK(tooShort.error.code == ErrorCode::INVALID_ARGUMENT);

    auto tokens = std::vector<int>{A, A};
    auto trellis = aligner.buildTrellis(framesOf({A, BLANK, A}), tokens);
    auto spans = aligner.backtrack(trellis, tokens);
    REQUIRE(spans.size() == 2);
    CHECK(spans[0].start_frame == 0);
    CHECK(spans[0].end_frame == 1);
    CHECK(spans[1].start_frame == 2);
    CHECK(spans[1].end_frame == 2);
}

// ============================================================================
// alignEmissions
// ============================================================================

TEST_CASE("ForcedAligner - word timings from emissions") {
    ForcedAligner aligner;
    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    auto result = aligner.alignEmissions(framesOf({A, A, SPACE, B, B, BLANK}), "a b");
    INFO(result.error.describe());
    REQUIRE(result.isOk());

    const auto& r = result.value;
    CHECK(r.num_frames == 6);
    CHECK(r.total_duration == doctest::Approx(0.12));
    REQUIRE(r.words.size() == 2);

    CHECK(r.words[0].text == "a");
    CHECK(r.words[0].word_index == 0);
    CHECK(r.words[0].char_offset == 0);
    CHECK(r.words[0].start_time == doctest::Approx(0.0));
    CHECK(r.words[0].duration == doctest::Approx(0.04));
    CHECK(r.words[0].confidence == doctest::Approx(0.97).epsilon(1e-4));

    CHECK(r.words[1].text == "b");
    CHECK(r.words[1].char_offset == 2);
    CHECK(r.words[1].start_time == doctest::Approx(0.06));
    CHECK(r.words[1].duration == doctest::Approx(0.06));
    // two dominant frames and one blank frame
    CHECK(r.words[1].confidence == doctest::Approx((0.97 + 0.97 + 0.01) / 3.0).epsilon(1e-4));

    CHECK(r.isValid());
}

TEST_CASE("ForcedAligner - explicit total duration is kept") {
    ForcedAligner aligner;
    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    auto result = aligner.alignEmissions(framesOf({A, BLANK}), "a", 1.5);
    REQUIRE(result.isOk());
    CHECK(result.value.total_duration == doctest::Approx(1.5));
}

TEST_CASE("ForcedAligner - words with no known characters") {
    ForcedAligner aligner;
    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    auto result = aligner.alignEmissions(framesOf({A, A, SPACE, B, B, BLANK}), "A 123 b");
    INFO(result.error.describe());
    REQUIRE(result.isOk());
    REQUIRE(result.value.words.size() == 3);

    const auto& skipped = result.value.words[1];
    CHECK(skipped.text == "123");
    CHECK(skipped.char_offset == 2);
    CHECK(skipped.char_length == 3);
    CHECK(skipped.duration == 0.0);
    CHECK(skipped.confidence == 0.0);
    CHECK(skipped.start_time == doctest::Approx(result.value.words[0].endTime()));

    CHECK(result.value.words[2].char_offset == 6);
    CHECK(result.value.words[2].start_time == doctest::Approx(0.06));
}

TEST_CASE("ForcedAligner - spaces can be left out") {
    AlignerConfig config;
    config.include_spaces = false;
    ForcedAligner aligner(config);
    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    auto result = aligner.alignEmissions(framesOf({A, B}), "a b");
    INFO(result.error.describe());
    REQUIRE(result.isOk());
    REQUIRE(result.value.words.size() == 2);
    CHECK(result.value.words[1].start_time == doctest::Approx(0.02));
}

TEST_CASE("ForcedAligner - alignEmissions errors") {
    SUBCASE("not initialized") {
        ForcedAligner aligner;
        auto result = aligner.alignEmissions(framesOf({A}), "a");
        CHECK(result.error.code == ErrorCode::INVALID_HANDLE);
    }

    ForcedAligner aligner;
    REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());

    SUBCASE("no frames") {
        CHECK(aligner.alignEmissions({}, "a").error.code == ErrorCode::INVALID_ARGUMENT);
    }

    SUBCASE("audio too short") {
        auto result = aligner.alignEmissions(framesOf({A}), "ab");
        CHECK(result.error.code == ErrorCode::INVALID_ARGUMENT);
        CHECK(result.error.message.find("too short") != std::string::npos);
    }

    SUBCASE("emissions narrower than the vocabulary") {
        auto result = aligner.alignEmissions(framesOf({A, A, B}, 3), "a b");
        CHECK(result.error.code == ErrorCode::SHAPE_MISMATCH);
    }

    SUBCASE("empty transcript") {
        auto result = aligner.alignEmissions(framesOf({A, B}), "   ");
        REQUIRE(result.isOk());
        CHECK(result.value.words.empty());
        CHECK_FALSE(result.value.isValid());
    }

    CHECK(aligner.initializeWithLabels({}).code == ErrorCode::INVALID_CONFIG);
}

// ============================================================================
// AlignmentResult
// ============================================================================

TEST_CASE("AlignmentResult - wordAt and isValid") {
    AlignmentResult result;
    CHECK_FALSE(result.isValid());
    CHECK(result.wordAt(0.0) == nullptr);

    WordTiming first;
    first.text = "hello";
    first.start_time = 0.0;
    first.duration = 0.5;
    WordTiming second;
    second.text = "world";
    second.start_time = 0.6;
    second.duration = 0.4;

    result.words = {first, second};
    result.total_duration = 1.0;
    CHECK(result.isValid());

    REQUIRE(result.wordAt(0.25) != nullptr);
    CHECK(result.wordAt(0.25)->text == "hello");
    CHECK(result.wordAt(0.55) == nullptr);
    REQUIRE(result.wordAt(0.6) != nullptr);
    CHECK(result.wordAt(0.6)->text == "world");
    CHECK(result.wordAt(1.5) == nullptr);

    std::swap(result.words[0], result.words[1]);
    CHECK_FALSE(result.isValid());

    std::swap(result.words[0], result.words[1]);
    result.total_duration = 0.0;
    CHECK_FALSE(result.isValid());
}

TEST_CASE("AlignerConfig - frame duration") {
    AlignerConfig config;
    CHECK(config.frameDuration() == doctest::Approx(0.02));
    CHECK(AlignerConfig::fromModelDir("/models").model_dir == "/models");
}

TEST_CASE("ForcedAligner - non-positive sample rate or hop size is rejected") {
    SUBCASE("sample_rate") {
        AlignerConfig config;
        config.sample_rate = 0;
        ForcedAligner aligner(config);
        auto err = aligner.initializeWithLabels(SMALL_LABELS);
        CHECK(err.code == ErrorCode::INVALID_CONFIG);
        CHECK_FALSE(aligner.isInitialized());
        CHECK(aligner.initialize().code == ErrorCode::INVALID_CONFIG);
    }

    SUBCASE("hop_size") {
        AlignerConfig config;
        config.hop_size = 0;
        ForcedAligner aligner(config);
        CHECK(aligner.initializeWithLabels(SMALL_LABELS).code == ErrorCode::INVALID_CONFIG);
        CHECK_FALSE(aligner.isInitialized());

        config.hop_size = -320;
        ForcedAligner negative(config);
        CHECK(negative.initializeWithLabels(SMALL_LABELS).code == ErrorCode::INVALID_CONFIG);
    }
}

// ============================================================================
// End to end through an inference session
// ============================================================================

TEST_CASE("ForcedAligner - initialize and align audio") {
    std::string dir = testutil::tempDir() + "/aligner_model";
    testutil::installEmissionsModel(dir);
    testutil::writeLabels(dir, testutil::mmsLabels());

    ForcedAligner aligner(AlignerConfig::fromModelDir(dir));
    auto err = aligner.initialize();
    INFO(err.describe());
    REQUIRE(err.isOk());
    CHECK(aligner.isInitialized());
    CHECK(aligner.hasSession());
    CHECK(aligner.getTokenizer()->vocabSize() == 29);

    // The model reshapes [1, S] into [1, S / 29, 29], so the "audio" is the logits
    const int h = 15;
    const int i = 2;
    std::vector<float> audio;
    for (int dominant : {h, h, i, 0}) {
        std::vector<float> logits(29, 0.0f);
        logits[dominant] = 10.0f;
        audio.insert(audio.end(), logits.begin(), logits.end());
    }

    auto emissions = aligner.computeEmissions(audio);
    INFO(emissions.error.describe());
    REQUIRE(emissions.isOk());
    REQUIRE(emissions.value.size() == 4);
    CHECK(emissions.value[0].size() == 29);
    CHECK(emissions.value[0][h] > -0.01f);

    auto result = aligner.align(audio, "Hi");
    INFO(result.error.describe());
    REQUIRE(result.isOk());
    CHECK(result.value.num_frames == 4);
    CHECK(result.value.total_duration == doctest::Approx(116.0 / 16000.0));
    REQUIRE(result.value.words.size() == 1);
    CHECK(result.value.words[0].text == "Hi");
    CHECK(result.value.words[0].start_time == doctest::Approx(0.0));
    CHECK(result.value.words[0].duration == doctest::Approx(0.08));
    CHECK(result.value.words[0].confidence > 0.5);
    CHECK(result.value.words[0].confidence <= 1.0);

    CHECK(aligner.computeEmissions({}).error.code == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("ForcedAligner - initialize reports missing files") {
    ForcedAligner aligner(AlignerConfig::fromModelDir(testutil::tempDir() + "/no_such_model"));
    auto err = aligner.initialize();
    CHECK(err.code == ErrorCode::MODEL_NOT_FOUND);
    CHECK_FALSE(aligner.isInitialized());

    std::vector<float> audio(29, 0.0f);
    CHECK(aligner.align(audio, "a").error.code == ErrorCode::INVALID_HANDLE);
}

TEST_CASE("ForcedAligner - initialize rejects unknown tensor names") {
    std::string dir = testutil::tempDir() + "/aligner_named";
    testutil::installEmissionsModel(dir);
    testutil::writeLabels(dir, testutil::mmsLabels());

    auto config = AlignerConfig::fromModelDir(dir);
    config.output_name = "logits";
    ForcedAligner aligner(config);
    CHECK(aligner.initialize().code == ErrorCode::UNKNOWN_TENSOR);
}

// ============================================================================
// Audio loading
// ============================================================================

TEST_CASE("ForcedAligner - loadAudio") {
    SUBCASE("missing file") {
        auto audio = ForcedAligner::loadAudio("/nonexistent/speech.wav", 16000);
        CHECK(audio.error.code == ErrorCode::IO_ERROR);
    }

    SUBCASE("stereo is downmixed") {
        auto path = writeWav("stereo.wav", 16000, 2, {16384, 0, -16384, -16384});
        auto audio = ForcedAligner::loadAudio(path, 16000);
        INFO(audio.error.describe());
        REQUIRE(audio.isOk());
        REQUIRE(audio.value.size() == 2);
        CHECK(audio.value[0] == doctest::Approx(0.25f));
        CHECK(audio.value[1] == doctest::Approx(-0.5f));
    }

    SUBCASE("wrong sample rate") {
        auto path = writeWav("narrowband.wav", 8000, 1, {0, 100, 200});
        auto audio = ForcedAligner::loadAudio(path, 16000);
        CHECK(audio.error.code == ErrorCode::UNSUPPORTED_FORMAT);

        ForcedAligner aligner;
        REQUIRE(aligner.initializeWithLabels(SMALL_LABELS).isOk());
        CHECK(aligner.alignFile(path, "a").error.code == ErrorCode::UNSUPPORTED_FORMAT);
    }
}
