#ifndef INFER_ALIGN_TYPES_HPP
#define INFER_ALIGN_TYPES_HPP

#include <string>
#include <vector>

namespace infer {
namespace align {

// 帧 x 词表 的对数概率矩阵, 以及 帧 x 状态 的 trellis
using Emissions = std::vector<std::vector<float>>;
using Trellis = std::vector<std::vector<float>>;

// =============================================================================
// Aligner Configuration (对齐配置)
// =============================================================================

struct AlignerConfig {
    // -------------------------------------------------------------------------
    // 模型文件
    // -------------------------------------------------------------------------

    std::string model_dir = "~/.cache/mms-fa";
    std::string model_file = "mms-fa.onnx";
    std::string labels_file = "labels.txt";
    std::string base_url;               // 缺失文件的下载地址, 空 = 不下载

    // -------------------------------------------------------------------------
    // 音频 / 帧参数 (MMS-FA: 16kHz, 每帧 320 采样 = 20ms)
    // -------------------------------------------------------------------------

    int sample_rate = 16000;
    int hop_size = 320;

    // -------------------------------------------------------------------------
    // 推理
    // -------------------------------------------------------------------------

    int num_threads = 0;
    bool use_accelerator = false;       // 不可用时退回 CPU
    std::string input_name;             // 空 = 模型的第一个输入
    std::string output_name;            // 空 = 模型的第一个输出
    bool apply_log_softmax = true;      // 模型输出为 logits 时需要

    // -------------------------------------------------------------------------
    // 分词
    // -------------------------------------------------------------------------

    bool include_spaces = true;         // 词之间插入 "*" 分隔符

    /// @brief 单帧时长 (秒)
    double frameDuration() const {
        return static_cast<double>(hop_size) / static_cast<double>(sample_rate);
    }

    static AlignerConfig fromModelDir(const std::string& dir) {
        AlignerConfig config;
        config.model_dir = dir;
        return config;
    }
};

// =============================================================================
// Token Span (回溯得到的 token 帧区间)
// =============================================================================

struct TokenSpan {
    int token_index = 0;    // 在 token 序列中的位置
    int token = 0;          // 词表索引
    int start_frame = 0;
    int end_frame = 0;      // 包含

    int frameCount() const { return end_frame - start_frame + 1; }
};

// =============================================================================
// Word Timing (词级时间戳)
// =============================================================================

struct WordTiming {
    int word_index = 0;         // 在 transcript 词序列中的位置
    std::string text;
    size_t char_offset = 0;     // 在 transcript 中的字节偏移
    size_t char_length = 0;

    double start_time = 0.0;    // 秒
    double duration = 0.0;      // 秒
    double confidence = 0.0;    // [0, 1], 词内各帧概率的平均值

    double endTime() const { return start_time + duration; }
};

// =============================================================================
// Alignment Result (对齐结果)
// =============================================================================

struct AlignmentResult {
    std::vector<WordTiming> words;     // 按时间顺序
    double total_duration = 0.0;       // 音频总时长 (秒)
    size_t num_frames = 0;

    /// @brief 给定时间正在发音的词, 无则返回 nullptr
    const WordTiming* wordAt(double time) const {
        for (const auto& word : words) {
            if (time >= word.start_time && time < word.endTime()) {
                return &word;
            }
        }
        return nullptr;
    }

    /// @brief 基本一致性检查: 非空, 起始时间不递减, 总时长在 (0, 1h) 内
    bool isValid() const {
        if (words.empty()) {
            return false;
        }
        for (size_t i = 1; i < words.size(); ++i) {
            if (words[i].start_time < words[i - 1].start_time) {
                return false;
            }
        }
        return total_duration > 0.0 && total_duration < 3600.0;
    }
};

}  // namespace align
}  // namespace infer

#endif  // INFER_ALIGN_TYPES_HPP
