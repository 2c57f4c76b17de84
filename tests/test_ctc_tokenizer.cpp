// test_ctc_tokenizer.cpp
// Tests for infer::align::CtcTokenizer
//
// Framework: doctest
// Runs with: no model, labels written to a temp dir
//
// These tests cover:
// - tokenize / detokenize with the MMS-FA vocabulary
// - blank and space indices
// - loading labels from a file

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "alignment/ctc_tokenizer.hpp"
#include "test_model_builder.hpp"

using infer::ErrorCode;
using infer::align::CtcTokenizer;

TEST_CASE("CtcTokenizer - vocabulary indices") {
    CtcTokenizer tokenizer(testutil::mmsLabels());

    CHECK(tokenizer.vocabSize() == 29);
    CHECK(tokenizer.blankIndex() == 0);
    REQUIRE(tokenizer.spaceIndex().has_value());
    CHECK(*tokenizer.spaceIndex() == 28);

    CHECK(tokenizer.label(1) == 'a');
    CHECK(tokenizer.label(28) == '*');
    CHECK_FALSE(tokenizer.label(100).has_value());
    CHECK_FALSE(tokenizer.label(-1).has_value());
}

TEST_CASE("CtcTokenizer - tokenize") {
    CtcTokenizer tokenizer(testutil::mmsLabels());

    CHECK(tokenizer.tokenize("hello") == std::vector<int>{15, 3, 12, 12, 5});
    CHECK(tokenizer.tokenize("HeLLo") == std::vector<int>{15, 3, 12, 12, 5});

    SUBCASE("apostrophe is a label") {
        auto tokens = tokenizer.tokenize("don't");
        CHECK(std::find(tokens.begin(), tokens.end(), 25) != tokens.end());
        CHECK(tokens.size() == 5);
    }

    SUBCASE("unknown characters are skipped") {
        CHECK(tokenizer.tokenize("h3llo!") == std::vector<int>{15, 12, 12, 5});
        CHECK(tokenizer.tokenize("").empty());
    }

    SUBCASE("spaces") {
        CHECK(tokenizer.tokenize("a b") == std::vector<int>{1, 28, 17});
        CHECK(tokenizer.tokenize("a b", false) == std::vector<int>{1, 17});
    }
}

TEST_CASE("CtcTokenizer - detokenize") {
    CtcTokenizer tokenizer(testutil::mmsLabels());

    CHECK(tokenizer.detokenize({15, 3, 12, 12, 5, 28, 19, 5, 9, 12, 13}) == "hello world");
    // out-of-range indices are dropped
    CHECK(tokenizer.detokenize({1, 99, 17}) == "ab");
}

TEST_CASE("CtcTokenizer - isKnown") {
    CtcTokenizer tokenizer(testutil::mmsLabels());
    CHECK(tokenizer.isKnown('a'));
    CHECK(tokenizer.isKnown('Z'));
    CHECK(tokenizer.isKnown('\''));
    CHECK_FALSE(tokenizer.isKnown('3'));
}

TEST_CASE("CtcTokenizer - vocabulary without a space label") {
    CtcTokenizer tokenizer(std::vector<std::string>{"a", "-", "b"});
    CHECK(tokenizer.blankIndex() == 1);
    CHECK_FALSE(tokenizer.spaceIndex().has_value());
    CHECK(tokenizer.tokenize("a b") == std::vector<int>{0, 2});
}

TEST_CASE("CtcTokenizer - fromFile") {
    std::string dir = testutil::tempDir() + "/tokenizer";

    SUBCASE("valid labels") {
        auto path = testutil::writeLabels(dir, testutil::mmsLabels());
        auto loaded = CtcTokenizer::fromFile(path);
        INFO(loaded.error.describe());
        REQUIRE(loaded.isOk());
        CHECK(loaded.value.vocabSize() == 29);
        CHECK(loaded.value.tokenize("hello") == std::vector<int>{15, 3, 12, 12, 5});
    }

    SUBCASE("windows line endings") {
        auto path = testutil::writeFile("crlf_labels.txt", "-\r\na\r\nb\r\n*\r\n");
        auto loaded = CtcTokenizer::fromFile(path);
        REQUIRE(loaded.isOk());
        CHECK(loaded.value.vocabSize() == 4);
        CHECK(loaded.value.spaceIndex() == 3);
    }

    SUBCASE("missing file") {
        auto loaded = CtcTokenizer::fromFile(dir + "/does_not_exist.txt");
        CHECK(loaded.error.code == ErrorCode::IO_ERROR);
    }

    SUBCASE("empty file") {
        auto path = testutil::writeFile("empty_labels.txt", "\n\n");
        auto loaded = CtcTokenizer::fromFile(path);
        CHECK(loaded.error.code == ErrorCode::INVALID_MODEL);
    }
}
