#ifndef INFER_HPP
#define INFER_HPP

// =============================================================================
// onnx_infer - 主包含文件
// =============================================================================
//
// 只需包含此文件即可使用 C++ 接口 (C 接口见 onnx_infer_api.h)
//
//   #include "infer.hpp"
//
// 快速开始:
//
//   // 1. 配置并创建会话
//   auto created = infer::InferenceSession::create(
//       infer::SessionConfig::cpu("~/models/model.onnx", 2));
//   if (!created) {
//       std::cerr << "Create failed: " << created.error.describe() << std::endl;
//       return -1;
//   }
//   auto& session = created.value;
//
//   // 2. 查询输出大小
//   auto size = session->getOutputSize({1, 16000}, "logits");
//
//   // 3. 推理
//   auto out = session->run("input", audio.data(), {1, 16000}, "logits");
//   if (out) {
//       std::cout << infer::shapeToString(out.value.shape) << std::endl;
//   }
//

#include <string>

// 核心类型
#include "infer_types.hpp"

// 配置
#include "infer_config.hpp"

// 推理会话
#include "inference_session.hpp"

// 执行后端 (通常不需要直接使用)
#include "backends/execution_backend.hpp"

// CTC 强制对齐
#include "alignment/alignment_types.hpp"
#include "alignment/ctc_tokenizer.hpp"
#include "alignment/forced_aligner.hpp"
#include "alignment/model_loader.hpp"

namespace infer {

// =============================================================================
// 版本信息
// =============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string getVersionString() {
    return std::to_string(VERSION_MAJOR) + "." +
        std::to_string(VERSION_MINOR) + "." +
        std::to_string(VERSION_PATCH);
}

// =============================================================================
// 使用示例
// =============================================================================
//
// 示例 1: 多输入多输出
// ---------------------
//
//   std::vector<infer::TensorView> inputs = {
//       {"audio", audio.data(), {1, n}},
//       {"speaker", embedding.data(), {1, 256}},
//   };
//   auto outs = session->run(inputs, {"mel", "durations"});
//
// 示例 2: 写入调用方缓冲区
// -------------------------
//
//   std::vector<float> buffer(size.value);
//   auto shape = session->runInto({"input", audio.data(), {1, n}}, "logits",
//                                 buffer.data(), buffer.size());
//   if (shape.error.code == infer::ErrorCode::BUFFER_TOO_SMALL) { ... }
//
// 示例 3: 词级强制对齐
// ---------------------
//
//   infer::align::ForcedAligner aligner;
//   if (aligner.initialize().isOk()) {
//       auto r = aligner.alignFile("speech.wav", "hello world");
//       for (const auto& w : r.value.words) {
//           std::cout << w.text << " @ " << w.start_time << "s" << std::endl;
//       }
//   }
//

}  // namespace infer

#endif  // INFER_HPP
