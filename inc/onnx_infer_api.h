/**
 * onnx_infer - C interface
 *
 * 对 InferenceSession 的不透明句柄封装, 供 C / Swift / Objective-C 等调用方使用。
 *
 * 使用示例:
 *
 *   OnnxSession* s = OnnxSessionCreate("model.onnx", 2, 0);
 *   if (!s) {
 *       fprintf(stderr, "%s\n", OnnxSessionGetLastError());
 *       return;
 *   }
 *
 *   int64_t in_shape[2] = {1, 16000};
 *   size_t n = OnnxSessionGetOutputSize(s, in_shape, 2, "logits");
 *
 *   float* out = malloc(n * sizeof(float));
 *   int64_t out_shape[8];
 *   size_t out_rank = 8;
 *   if (OnnxSessionRunChecked(s, "input", audio, in_shape, 2, "logits",
 *                             out, n, out_shape, &out_rank) != 0) {
 *       fprintf(stderr, "%s\n", OnnxSessionGetLastError());
 *   }
 *
 *   OnnxSessionDestroy(s);
 *
 * 错误约定:
 *   - 失败时返回 NULL / 0 / 非零状态, 文本可由 OnnxSessionGetLastError() 取得
 *   - 错误文本按线程保存, 成功的调用会清空本线程的错误
 *   - 非零状态码为 -ErrorCode (见 infer_types.hpp)
 */

#ifndef ONNX_INFER_API_H
#define ONNX_INFER_API_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct OnnxSession OnnxSession;

/** 状态码 (与 infer::ErrorCode 取负值一致) */
#define ONNX_INFER_OK                    0
#define ONNX_INFER_ERR_INVALID_HANDLE   (-200)
#define ONNX_INFER_ERR_INVALID_ARGUMENT (-201)
#define ONNX_INFER_ERR_UNKNOWN_TENSOR   (-202)
#define ONNX_INFER_ERR_SHAPE_MISMATCH   (-203)
#define ONNX_INFER_ERR_BUFFER_TOO_SMALL (-204)
#define ONNX_INFER_ERR_INFERENCE_FAILED (-205)

/**
 * 加载模型并创建会话
 * @param model_path     模型文件路径 (支持 ~ 开头)
 * @param num_threads    intra-op 线程数, 0 表示 ONNX Runtime 默认值
 * @param use_accelerator 非零时使用硬件加速 provider (CUDA / CoreML / XNNPACK)
 * @return 会话句柄, 失败返回 NULL
 */
OnnxSession* OnnxSessionCreate(const char* model_path, int num_threads, int use_accelerator);

/** 释放会话; NULL 与已释放的句柄均为空操作 */
void OnnxSessionDestroy(OnnxSession* session);

/** 本线程最近一次失败的错误文本; 无错误时返回 NULL */
const char* OnnxSessionGetLastError(void);

/**
 * 给定输入形状时输出张量的元素数
 * @return 元素数, 失败返回 0
 */
size_t OnnxSessionGetOutputSize(OnnxSession* session,
                                const int64_t* input_shape,
                                size_t input_shape_len,
                                const char* output_name);

/**
 * 同步执行一次推理
 *
 * output_data 必须至少容纳 OnnxSessionGetOutputSize() 个 float, 本函数不做检查;
 * 需要检查时使用 OnnxSessionRunChecked()。
 *
 * @param output_shape      输出形状缓冲区
 * @param output_shape_len  入参为 output_shape 容量, 返回时为实际维数
 * @return 0 成功, 否则为负的错误码
 */
int OnnxSessionRun(OnnxSession* session,
                   const char* input_name,
                   const float* input_data,
                   const int64_t* input_shape,
                   size_t input_shape_len,
                   const char* output_name,
                   float* output_data,
                   int64_t* output_shape,
                   size_t* output_shape_len);

/**
 * 同 OnnxSessionRun, 但 output_capacity 不足时返回
 * ONNX_INFER_ERR_BUFFER_TOO_SMALL 且不写入 output_data
 */
int OnnxSessionRunChecked(OnnxSession* session,
                          const char* input_name,
                          const float* input_data,
                          const int64_t* input_shape,
                          size_t input_shape_len,
                          const char* output_name,
                          float* output_data,
                          size_t output_capacity,
                          int64_t* output_shape,
                          size_t* output_shape_len);

#ifdef __cplusplus
}
#endif

#endif  // ONNX_INFER_API_H
