// test_concurrency.cpp
// Concurrent use of sessions and the C interface
//
// Framework: doctest
// Runs with: ONNX Runtime CPU provider, models generated at build time
//
// These tests cover:
// - two handles on two threads never see each other's outputs
// - concurrent calls on one handle are serialised
// - last-error text is per thread

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "inference_session.hpp"
#include "onnx_infer_api.h"
#include "test_model_builder.hpp"

namespace {

constexpr int ITERATIONS = 200;

// 每次运行使用不同的输入, 校验输出逐元素一致
bool runMany(OnnxSession* session, float base) {
    int64_t shape[2] = {1, 64};
    std::vector<float> input(64);
    std::vector<float> output(64);
    int64_t out_shape[2];

    for (int it = 0; it < ITERATIONS; ++it) {
        for (size_t i = 0; i < input.size(); ++i) {
            input[i] = base + static_cast<float>(it * 100 + static_cast<int>(i));
        }
        size_t out_rank = 2;
        int status = OnnxSessionRunChecked(session, "input", input.data(), shape, 2, "output",
                                           output.data(), output.size(), out_shape, &out_rank);
        if (status != 0 || output != input) {
            return false;
        }
    }
    return true;
}

}  // namespace

TEST_CASE("Concurrency - two handles on two threads") {
    std::string model = testutil::identityModel();
    OnnxSession* a = OnnxSessionCreate(model.c_str(), 1, 0);
    OnnxSession* b = OnnxSessionCreate(model.c_str(), 1, 0);
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);

    std::atomic<bool> ok_a{false};
    std::atomic<bool> ok_b{false};

    std::thread ta([&] { ok_a = runMany(a, 0.0f); });
    std::thread tb([&] { ok_b = runMany(b, -1.0e6f); });
    ta.join();
    tb.join();

    CHECK(ok_a.load());
    CHECK(ok_b.load());

    OnnxSessionDestroy(a);
    OnnxSessionDestroy(b);
}

TEST_CASE("Concurrency - one handle shared by several threads") {
    OnnxSession* session = OnnxSessionCreate(testutil::identityModel().c_str(), 1, 0);
    REQUIRE(session != nullptr);

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            if (!runMany(session, static_cast<float>(t) * 1.0e5f)) {
                ++failures;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(failures.load() == 0);
    OnnxSessionDestroy(session);
}

TEST_CASE("Concurrency - C++ sessions run independently") {
    std::string model = testutil::flattenModel();
    auto a = infer::InferenceSession::create(infer::SessionConfig::cpu(model, 1));
    auto b = infer::InferenceSession::create(infer::SessionConfig::cpu(model, 1));
    REQUIRE(a.isOk());
    REQUIRE(b.isOk());

    std::atomic<bool> ok_a{true};
    std::atomic<bool> ok_b{true};

    auto worker = [](infer::InferenceSession& session, float value, std::atomic<bool>& ok) {
        std::vector<float> input(2 * 3 * 4, value);
        for (int it = 0; it < ITERATIONS; ++it) {
            auto out = session.run("input", input.data(), {2, 3, 4}, "output");
            if (!out.isOk() || out.value.shape != infer::Shape{2, 12} || out.value.data != input) {
                ok = false;
                return;
            }
            // 同时查询输出大小 (缓存路径)
            auto size = session.getOutputSize({2, 3, 4}, "output");
            if (!size.isOk() || size.value != 24) {
                ok = false;
                return;
            }
        }
    };

    std::thread ta(worker, std::ref(*a.value), 1.0f, std::ref(ok_a));
    std::thread tb(worker, std::ref(*b.value), 2.0f, std::ref(ok_b));
    ta.join();
    tb.join();

    CHECK(ok_a.load());
    CHECK(ok_b.load());
}

TEST_CASE("Concurrency - last error is per thread") {
    OnnxSession* session = OnnxSessionCreate(testutil::identityModel().c_str(), 1, 0);
    REQUIRE(session != nullptr);

    std::string seen_failing;
    bool create_failed = false;
    bool seen_ok_is_null = false;

    std::thread failing([&] {
        create_failed = OnnxSessionCreate("/nonexistent/thread_a.onnx", 0, 0) == nullptr;
        const char* err = OnnxSessionGetLastError();
        seen_failing = err ? err : "";
    });
    failing.join();

    std::thread succeeding([&] {
        int64_t shape[2] = {1, 1};
        size_t n = OnnxSessionGetOutputSize(session, shape, 2, "output");
        seen_ok_is_null = (n == 1 && OnnxSessionGetLastError() == nullptr);
    });
    succeeding.join();

    CHECK(create_failed);
    CHECK(seen_failing.find("thread_a.onnx") != std::string::npos);
    CHECK(seen_ok_is_null);

    // the main thread never failed
    CHECK(OnnxSessionGetLastError() == nullptr);

    OnnxSessionDestroy(session);
}
