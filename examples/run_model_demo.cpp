/**
 * onnx_infer 模型推理示例 (C 接口)
 *
 * Usage:
 *   ./run_model_demo <model.onnx> [input_name] [output_name] [dims...]
 *
 * Examples:
 *   ./run_model_demo ~/.cache/mms-fa/mms-fa.onnx
 *   ./run_model_demo model.onnx input logits 1 16000
 */

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "onnx_infer_api.h"
#include "infer.hpp"

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <model.onnx> [input_name] [output_name] [dims...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Arguments:" << std::endl;
    std::cout << "  model.onnx   Path to ONNX model file" << std::endl;
    std::cout << "  input_name   Model input (default: first declared input)" << std::endl;
    std::cout << "  output_name  Model output (default: first declared output)" << std::endl;
    std::cout << "  dims         Input shape (default: 1 16000)" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " ~/.cache/mms-fa/mms-fa.onnx" << std::endl;
    std::cout << "  " << program << " model.onnx input logits 1 16000" << std::endl;
}

void PrintModelInfo(const std::string& model_path) {
    // C++ 接口读取模型声明的输入输出
    auto created = infer::InferenceSession::create(infer::SessionConfig::cpu(model_path));
    if (!created) {
        std::cerr << "无法读取模型信息: " << created.error.describe() << std::endl;
        return;
    }

    std::cout << "Provider: " << created.value->getProviderName() << std::endl;
    for (const auto& in : created.value->getInputs()) {
        std::cout << "  input  " << in.name << " " << infer::shapeToString(in.shape) << std::endl;
    }
    for (const auto& out : created.value->getOutputs()) {
        std::cout << "  output " << out.name << " " << infer::shapeToString(out.shape) << std::endl;
    }
    std::cout << std::endl;
}

int RunModel(const std::string& model_path, std::string input_name, std::string output_name,
             const std::vector<int64_t>& input_shape) {
    std::cout << "========================================" << std::endl;
    std::cout << "    onnx_infer 推理测试" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    PrintModelInfo(model_path);

    if (input_name.empty() || output_name.empty()) {
        auto created = infer::InferenceSession::create(infer::SessionConfig::cpu(model_path));
        if (!created) {
            std::cerr << created.error.describe() << std::endl;
            return 1;
        }
        if (input_name.empty()) input_name = created.value->getInputs().front().name;
        if (output_name.empty()) output_name = created.value->getOutputs().front().name;
    }

    // 1. 创建会话
    std::cout << ">>> 创建会话..." << std::endl;
    OnnxSession* session = OnnxSessionCreate(model_path.c_str(), 0, 0);
    if (!session) {
        std::cerr << "创建失败: " << OnnxSessionGetLastError() << std::endl;
        return 1;
    }

    // 2. 查询输出大小
    size_t output_size = OnnxSessionGetOutputSize(session, input_shape.data(),
        input_shape.size(), output_name.c_str());
    if (output_size == 0 && OnnxSessionGetLastError()) {
        std::cerr << "查询输出大小失败: " << OnnxSessionGetLastError() << std::endl;
        OnnxSessionDestroy(session);
        return 1;
    }
    std::cout << "输出元素数: " << output_size << std::endl;

    // 3. 零输入推理
    size_t input_size = infer::shapeElementCount(input_shape);
    std::vector<float> input(input_size, 0.0f);
    std::vector<float> output(output_size);
    std::vector<int64_t> output_shape(8);
    size_t output_rank = output_shape.size();

    std::cout << ">>> 开始推理..." << std::endl;
    auto start = std::chrono::steady_clock::now();

    int status = OnnxSessionRunChecked(session, input_name.c_str(), input.data(),
        input_shape.data(), input_shape.size(), output_name.c_str(),
        output.data(), output.size(), output_shape.data(), &output_rank);

    auto end = std::chrono::steady_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (status != 0) {
        std::cerr << "推理失败 (" << status << "): " << OnnxSessionGetLastError() << std::endl;
        OnnxSessionDestroy(session);
        return 1;
    }

    // 4. 输出结果
    output_shape.resize(output_rank);
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "           推理结果" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "输出形状: " << infer::shapeToString(output_shape) << std::endl;
    std::cout << "耗时: " << std::fixed << std::setprecision(2) << elapsed_ms << " ms" << std::endl;

    if (!output.empty()) {
        std::cout << "前几个值:";
        for (size_t i = 0; i < output.size() && i < 8; ++i) {
            std::cout << " " << std::setprecision(4) << output[i];
        }
        std::cout << std::endl;
    }

    OnnxSessionDestroy(session);
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string model_path = infer::align::ModelLoader::expandPath(argv[1]);
    std::string input_name = argc > 2 ? argv[2] : "";
    std::string output_name = argc > 3 ? argv[3] : "";

    std::vector<int64_t> input_shape;
    for (int i = 4; i < argc; ++i) {
        input_shape.push_back(std::strtoll(argv[i], nullptr, 10));
    }
    if (input_shape.empty()) {
        input_shape = {1, 16000};
    }

    return RunModel(model_path, input_name, output_name, input_shape);
}
