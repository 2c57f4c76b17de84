/**
 * onnx_infer 强制对齐示例
 *
 * Usage:
 *   ./align_file_demo <audio_file> "<transcript>" [model_dir]
 *
 * Examples:
 *   ./align_file_demo ~/hello.wav "hello world"
 *   ./align_file_demo ~/hello.wav "hello world" ~/.cache/mms-fa
 */

#include <iomanip>
#include <iostream>
#include <string>

#include "infer.hpp"

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <audio_file> \"<transcript>\" [model_dir]" << std::endl;
    std::cout << std::endl;
    std::cout << "Arguments:" << std::endl;
    std::cout << "  audio_file  Path to 16kHz WAV audio file" << std::endl;
    std::cout << "  transcript  Text spoken in the audio" << std::endl;
    std::cout << "  model_dir   Directory with mms-fa.onnx and labels.txt" << std::endl;
    std::cout << "              Default: ~/.cache/mms-fa" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " ~/hello.wav \"hello world\"" << std::endl;
    std::cout << "  " << program << " ~/hello.wav \"hello world\" /path/to/models" << std::endl;
}

int AlignFile(const std::string& audio_file, const std::string& transcript,
              const std::string& model_dir) {
    std::cout << "========================================" << std::endl;
    std::cout << "    onnx_infer 强制对齐测试" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    // 1. 初始化对齐器
    std::cout << ">>> 初始化对齐器..." << std::endl;
    auto config = infer::align::AlignerConfig::fromModelDir(model_dir);
    infer::align::ForcedAligner aligner(config);

    auto err = aligner.initialize();
    if (!err.isOk()) {
        std::cerr << "初始化失败: " << err.describe() << std::endl;
        return 1;
    }

    std::cout << "模型目录: " << model_dir << std::endl;
    std::cout << "采样率: " << config.sample_rate << " Hz" << std::endl;
    std::cout << "音频文件: " << audio_file << std::endl;
    std::cout << "文本: " << transcript << std::endl;
    std::cout << std::endl;

    // 2. 对齐 (阻塞直到完成)
    std::cout << ">>> 开始对齐..." << std::endl;
    auto result = aligner.alignFile(audio_file, transcript);
    if (!result) {
        std::cerr << "对齐失败: " << result.error.describe() << std::endl;
        return 1;
    }

    // 3. 输出词级时间戳
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "           对齐结果" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "音频时长: " << std::fixed << std::setprecision(2)
            << result.value.total_duration << " s (" << result.value.num_frames
            << " frames)" << std::endl;
    std::cout << std::endl;

    for (const auto& word : result.value.words) {
        std::cout << "  [" << std::setw(2) << word.word_index << "] "
                << std::setprecision(3) << word.start_time << "s - "
                << word.endTime() << "s  "
                << std::setprecision(2) << "(" << word.confidence << ")  "
                << word.text << std::endl;
    }

    if (!result.value.isValid()) {
        std::cout << std::endl << "警告: 对齐结果未通过一致性检查" << std::endl;
    }

    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string audio_file = infer::align::ModelLoader::expandPath(argv[1]);
    std::string transcript = argv[2];
    std::string model_dir = argc > 3 ? argv[3] : "~/.cache/mms-fa";

    return AlignFile(audio_file, transcript, model_dir);
}
