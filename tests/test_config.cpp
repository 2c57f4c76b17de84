// test_config.cpp
// Tests for SessionConfig, ConfigValidator, core types and the backend factory
//
// Framework: doctest
// Runs with: ONNX Runtime (provider queries only, no model needed)

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "infer_config.hpp"
#include "infer_types.hpp"
#include "backends/execution_backend.hpp"

using namespace infer;

// ============================================================================
// SessionConfig
// ============================================================================

TEST_CASE("SessionConfig - defaults") {
    SessionConfig config;
    CHECK(config.num_threads == 0);
    CHECK(config.backend == BackendType::CPU);
    CHECK_FALSE(config.fallback_to_cpu);
    CHECK(config.graph_optimization == GraphOptimization::ALL);
    CHECK(config.enable_mem_arena);
    CHECK_FALSE(config.accelerator_preference.empty());
    CHECK(config.accelerator_preference.front() == "CUDAExecutionProvider");
}

TEST_CASE("SessionConfig - builders") {
    auto cpu = SessionConfig::cpu("model.onnx", 4);
    CHECK(cpu.model_path == "model.onnx");
    CHECK(cpu.num_threads == 4);
    CHECK(cpu.backend == BackendType::CPU);

    auto acc = SessionConfig::accelerated("model.onnx").withCpuFallback().withVerbose();
    CHECK(acc.backend == BackendType::ACCELERATED);
    CHECK(acc.fallback_to_cpu);
    CHECK(acc.verbose);

    auto lean = cpu.withThreads(1).withoutArena();
    CHECK(lean.num_threads == 1);
    CHECK_FALSE(lean.enable_mem_arena);
    CHECK_FALSE(lean.enable_mem_pattern);

    // builders copy
    CHECK(cpu.num_threads == 4);
    CHECK(cpu.enable_mem_arena);
}

// ============================================================================
// ConfigValidator
// ============================================================================

TEST_CASE("ConfigValidator - accepts a valid config") {
    CHECK(ConfigValidator::validate(SessionConfig::cpu("model.onnx")).isOk());
    CHECK(ConfigValidator::validate(SessionConfig::accelerated("model.onnx", 2)).isOk());
}

TEST_CASE("ConfigValidator - rejects empty path") {
    auto err = ConfigValidator::validate(SessionConfig{});
    CHECK(err.code == ErrorCode::INVALID_CONFIG);
    CHECK(err.message.find("path") != std::string::npos);
}

TEST_CASE("ConfigValidator - rejects negative thread counts") {
    auto err = ConfigValidator::validate(SessionConfig::cpu("model.onnx", -1));
    CHECK(err.code == ErrorCode::INVALID_CONFIG);
    CHECK(err.detail == "got -1");

    auto config = SessionConfig::cpu("model.onnx");
    config.inter_op_threads = -3;
    CHECK(ConfigValidator::validate(config).code == ErrorCode::INVALID_CONFIG);
}

TEST_CASE("ConfigValidator - accelerated needs a provider list") {
    auto config = SessionConfig::accelerated("model.onnx");
    config.accelerator_preference.clear();
    CHECK(ConfigValidator::validate(config).code == ErrorCode::INVALID_CONFIG);
}

// ============================================================================
// Core types
// ============================================================================

TEST_CASE("ErrorInfo - describe") {
    CHECK(ErrorInfo::ok().isOk());
    CHECK(ErrorInfo::error(ErrorCode::IO_ERROR, "read failed").describe() == "read failed");
    CHECK(ErrorInfo::error(ErrorCode::IO_ERROR, "read failed", "a.wav").describe() ==
          "read failed: a.wav");
    CHECK(std::string(errorCodeToString(ErrorCode::BUFFER_TOO_SMALL)) == "BUFFER_TOO_SMALL");
}

TEST_CASE("Result - zero is a valid success value") {
    auto ok = Result<size_t>::success(0);
    CHECK(ok.isOk());
    CHECK(static_cast<bool>(ok));
    CHECK(ok.value == 0);

    auto bad = Result<size_t>::failure(ErrorInfo::error(ErrorCode::INVALID_HANDLE, "gone"));
    CHECK_FALSE(bad.isOk());
    CHECK(bad.error.code == ErrorCode::INVALID_HANDLE);
}

TEST_CASE("Shape helpers") {
    CHECK(shapeElementCount({}) == 1);
    CHECK(shapeElementCount({2, 3, 4}) == 24);
    CHECK(shapeElementCount({5, 0}) == 0);
    CHECK(shapeElementCount({-1, 4}) == 0);
    CHECK(shapeToString({1, 16000}) == "[1, 16000]");
    CHECK(shapeToString({}) == "[]");

    TensorInfo info;
    info.shape = {1, -1};
    CHECK(info.isDynamic());
    info.shape = {1, 2};
    CHECK_FALSE(info.isDynamic());
}

TEST_CASE("Shape helpers - checked element count") {
    size_t count = 99;

    CHECK(checkedElementCount({2, 3, 4}, count));
    CHECK(count == 24);

    SUBCASE("product wraps size_t") {
        CHECK_FALSE(checkedElementCount({int64_t(1) << 32, int64_t(1) << 32}, count));
        CHECK(count == 0);
        CHECK(shapeElementCount({int64_t(1) << 32, int64_t(1) << 32}) == 0);
    }

    SUBCASE("product above the float limit") {
        CHECK_FALSE(checkedElementCount({3, int64_t(1) << 62}, count));
        CHECK(checkedElementCount({static_cast<int64_t>(MAX_TENSOR_ELEMENTS)}, count));
        CHECK(count == MAX_TENSOR_ELEMENTS);
    }

    SUBCASE("a zero dim wins over huge dims") {
        CHECK(checkedElementCount({int64_t(1) << 62, 0, int64_t(1) << 62}, count));
        CHECK(count == 0);
    }

    SUBCASE("negative dims") {
        CHECK_FALSE(checkedElementCount({4, -1}, count));
        CHECK_FALSE(checkedElementCount({0, -1}, count));
    }
}

TEST_CASE("LogLevel - ordering") {
    SessionConfig config = SessionConfig::cpu("model.onnx");
    config.log_level = LogLevel::ERR;
    CHECK(static_cast<int>(LogLevel::ERR) > static_cast<int>(LogLevel::WARNING));
    CHECK(static_cast<int>(LogLevel::ERR) < static_cast<int>(LogLevel::FATAL));
    CHECK(ConfigValidator::validate(config).isOk());
}

// ============================================================================
// ExecutionBackendFactory
// ============================================================================

TEST_CASE("ExecutionBackendFactory - CPU is always available") {
    CHECK(ExecutionBackendFactory::isAvailable(BackendType::CPU));

    auto backends = ExecutionBackendFactory::getAvailableBackends();
    CHECK(std::find(backends.begin(), backends.end(), BackendType::CPU) != backends.end());

    auto providers = ExecutionBackendFactory::getAvailableProviders();
    CHECK(std::find(providers.begin(), providers.end(), "CPUExecutionProvider") != providers.end());

    auto backend = ExecutionBackendFactory::create(SessionConfig::cpu("model.onnx"));
    REQUIRE(backend != nullptr);
    CHECK(backend->getType() == BackendType::CPU);
    CHECK(backend->getProviderName() == "CPUExecutionProvider");
    CHECK(backend->isAvailable());
}

TEST_CASE("ExecutionBackendFactory - unknown provider preference is unavailable") {
    auto config = SessionConfig::accelerated("model.onnx");
    config.accelerator_preference = {"NoSuchExecutionProvider"};

    auto backend = ExecutionBackendFactory::create(config);
    REQUIRE(backend != nullptr);
    CHECK(backend->getType() == BackendType::ACCELERATED);
    CHECK_FALSE(backend->isAvailable());

    Ort::SessionOptions options;
    auto err = backend->apply(options);
    CHECK(err.code == ErrorCode::BACKEND_UNAVAILABLE);
    CHECK(err.detail.find("NoSuchExecutionProvider") != std::string::npos);
}
