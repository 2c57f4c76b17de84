/**
 * onnx_infer Python Bindings
 *
 * Provides Python interface to InferenceSession and the CTC forced aligner
 * using pybind11. Tensors are exchanged as numpy float32 arrays.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "infer.hpp"

namespace py = pybind11;

namespace {

using FloatArray = py::array_t<float, py::array::c_style | py::array::forcecast>;

// Result<T> 失败时抛出, 文本带上错误码
[[noreturn]] void throwError(const infer::ErrorInfo& error) {
    throw std::runtime_error("[" + std::string(infer::errorCodeToString(error.code)) + "] " +
        error.describe());
}

infer::Shape arrayShape(const FloatArray& array) {
    infer::Shape shape;
    for (py::ssize_t i = 0; i < array.ndim(); ++i) {
        shape.push_back(static_cast<int64_t>(array.shape(i)));
    }
    return shape;
}

py::array_t<float> toArray(const infer::Tensor& tensor) {
    std::vector<py::ssize_t> shape(tensor.shape.begin(), tensor.shape.end());
    py::array_t<float> out(shape);
    if (tensor.elementCount() > 0) {
        std::copy(tensor.data.begin(), tensor.data.end(), out.mutable_data());
    }
    return out;
}

}  // namespace

// =============================================================================
// Python Module Definition
// =============================================================================

PYBIND11_MODULE(_onnx_infer, m) {
    m.doc() = "ONNX Runtime session wrapper and CTC forced alignment";

    // -------------------------------------------------------------------------
    // Enums
    // -------------------------------------------------------------------------

    py::enum_<infer::BackendType>(m, "BackendType", "Execution backend types")
        .value("CPU", infer::BackendType::CPU, "CPU execution provider")
        .value("ACCELERATED", infer::BackendType::ACCELERATED,
            "First available hardware provider")
        .export_values();

    py::enum_<infer::GraphOptimization>(m, "GraphOptimization", "Graph optimization levels")
        .value("DISABLED", infer::GraphOptimization::DISABLED)
        .value("BASIC", infer::GraphOptimization::BASIC)
        .value("EXTENDED", infer::GraphOptimization::EXTENDED)
        .value("ALL", infer::GraphOptimization::ALL)
        .export_values();

    py::enum_<infer::ErrorCode>(m, "ErrorCode", "Error codes")
        .value("OK", infer::ErrorCode::OK)
        .value("INVALID_CONFIG", infer::ErrorCode::INVALID_CONFIG)
        .value("MODEL_NOT_FOUND", infer::ErrorCode::MODEL_NOT_FOUND)
        .value("INVALID_MODEL", infer::ErrorCode::INVALID_MODEL)
        .value("BACKEND_UNAVAILABLE", infer::ErrorCode::BACKEND_UNAVAILABLE)
        .value("INVALID_HANDLE", infer::ErrorCode::INVALID_HANDLE)
        .value("INVALID_ARGUMENT", infer::ErrorCode::INVALID_ARGUMENT)
        .value("UNKNOWN_TENSOR", infer::ErrorCode::UNKNOWN_TENSOR)
        .value("SHAPE_MISMATCH", infer::ErrorCode::SHAPE_MISMATCH)
        .value("BUFFER_TOO_SMALL", infer::ErrorCode::BUFFER_TOO_SMALL)
        .value("INFERENCE_FAILED", infer::ErrorCode::INFERENCE_FAILED)
        .value("IO_ERROR", infer::ErrorCode::IO_ERROR)
        .value("NETWORK_ERROR", infer::ErrorCode::NETWORK_ERROR)
        .value("UNSUPPORTED_FORMAT", infer::ErrorCode::UNSUPPORTED_FORMAT)
        .value("INTERNAL_ERROR", infer::ErrorCode::INTERNAL_ERROR)
        .value("OUT_OF_MEMORY", infer::ErrorCode::OUT_OF_MEMORY)
        .export_values();

    // -------------------------------------------------------------------------
    // Error Info
    // -------------------------------------------------------------------------

    py::class_<infer::ErrorInfo>(m, "ErrorInfo", "Error information")
        .def(py::init<>())
        .def_readonly("code", &infer::ErrorInfo::code)
        .def_readonly("message", &infer::ErrorInfo::message)
        .def_readonly("detail", &infer::ErrorInfo::detail)
        .def("is_ok", &infer::ErrorInfo::isOk, "Check if no error")
        .def("__bool__", &infer::ErrorInfo::isOk)
        .def("__repr__", [](const infer::ErrorInfo& e) {
            if (e.isOk()) return std::string("ErrorInfo(OK)");
            return "ErrorInfo(" + e.describe() + ")";
        });

    // -------------------------------------------------------------------------
    // Tensor Metadata & Stats
    // -------------------------------------------------------------------------

    py::class_<infer::TensorInfo>(m, "TensorInfo", "Declared model input/output")
        .def_readonly("name", &infer::TensorInfo::name)
        .def_readonly("shape", &infer::TensorInfo::shape)
        .def_readonly("symbolic_dims", &infer::TensorInfo::symbolic_dims)
        .def("is_dynamic", &infer::TensorInfo::isDynamic)
        .def("__repr__", [](const infer::TensorInfo& t) {
            return "TensorInfo('" + t.name + "', " + infer::shapeToString(t.shape) + ")";
        });

    py::class_<infer::InferenceStats>(m, "InferenceStats", "Timing of the last run")
        .def_readonly("inference_time_ms", &infer::InferenceStats::inference_time_ms)
        .def_readonly("copy_time_ms", &infer::InferenceStats::copy_time_ms)
        .def_readonly("total_time_ms", &infer::InferenceStats::total_time_ms)
        .def_readonly("run_count", &infer::InferenceStats::run_count);

    // -------------------------------------------------------------------------
    // Session Config
    // -------------------------------------------------------------------------

    py::class_<infer::SessionConfig>(m, "SessionConfig", "Inference session configuration")
        .def(py::init<>())
        .def(py::init([](const std::string& model_path) {
            return infer::SessionConfig::cpu(model_path);
        }), py::arg("model_path"), "Create CPU configuration for a model file")
        .def_readwrite("model_path", &infer::SessionConfig::model_path)
        .def_readwrite("num_threads", &infer::SessionConfig::num_threads)
        .def_readwrite("inter_op_threads", &infer::SessionConfig::inter_op_threads)
        .def_readwrite("backend", &infer::SessionConfig::backend)
        .def_readwrite("accelerator_preference", &infer::SessionConfig::accelerator_preference)
        .def_readwrite("fallback_to_cpu", &infer::SessionConfig::fallback_to_cpu)
        .def_readwrite("graph_optimization", &infer::SessionConfig::graph_optimization)
        .def_readwrite("enable_mem_arena", &infer::SessionConfig::enable_mem_arena)
        .def_readwrite("enable_mem_pattern", &infer::SessionConfig::enable_mem_pattern)
        .def_readwrite("log_id", &infer::SessionConfig::log_id)
        .def_readwrite("verbose", &infer::SessionConfig::verbose)
        // Static factory methods
        .def_static("cpu", &infer::SessionConfig::cpu,
                    py::arg("model_path"), py::arg("num_threads") = 0,
                    "Create CPU configuration")
        .def_static("accelerated", &infer::SessionConfig::accelerated,
                    py::arg("model_path"), py::arg("num_threads") = 0,
                    "Create accelerated configuration")
        // Builder methods
        .def("with_threads", &infer::SessionConfig::withThreads, py::arg("threads"))
        .def("with_cpu_fallback", &infer::SessionConfig::withCpuFallback)
        .def("with_verbose", &infer::SessionConfig::withVerbose)
        .def("without_arena", &infer::SessionConfig::withoutArena);

    // -------------------------------------------------------------------------
    // Inference Session
    // -------------------------------------------------------------------------

    py::class_<infer::InferenceSession>(m, "InferenceSession", "ONNX Runtime inference session")
        .def(py::init([](const infer::SessionConfig& config) {
            auto created = infer::InferenceSession::create(config);
            if (!created) {
                throwError(created.error);
            }
            return std::move(created.value);
        }), py::arg("config"), "Load a model (raises RuntimeError on failure)")

        .def("run", [](infer::InferenceSession& self, const std::string& input_name,
                        FloatArray input, const std::string& output_name) {
            infer::TensorView view;
            view.name = input_name;
            view.data = input.data();
            view.shape = arrayShape(input);

            infer::Result<infer::Tensor> result;
            {
                // Release GIL during ONNX inference
                py::gil_scoped_release release;
                result = self.run(view, output_name);
            }
            if (!result) {
                throwError(result.error);
            }
            return toArray(result.value);
        }, py::arg("input_name"), py::arg("input"), py::arg("output_name"),
            "Run one forward pass and return the named output")

        .def("output_shape", [](infer::InferenceSession& self, const infer::Shape& input_shape,
                                const std::string& output_name) {
            infer::Result<infer::Shape> result;
            {
                py::gil_scoped_release release;
                result = self.getOutputShape(input_shape, output_name);
            }
            if (!result) {
                throwError(result.error);
            }
            return result.value;
        }, py::arg("input_shape"), py::arg("output_name"))

        .def("output_size", [](infer::InferenceSession& self, const infer::Shape& input_shape,
                               const std::string& output_name) {
            infer::Result<size_t> result;
            {
                py::gil_scoped_release release;
                result = self.getOutputSize(input_shape, output_name);
            }
            if (!result) {
                throwError(result.error);
            }
            return result.value;
        }, py::arg("input_shape"), py::arg("output_name"))

        .def("release", &infer::InferenceSession::release, "Release native resources")
        .def_property_readonly("released", &infer::InferenceSession::isReleased)
        .def_property_readonly("inputs", &infer::InferenceSession::getInputs)
        .def_property_readonly("outputs", &infer::InferenceSession::getOutputs)
        .def_property_readonly("provider", &infer::InferenceSession::getProviderName)
        .def_property_readonly("last_stats", &infer::InferenceSession::getLastStats);

    m.def("available_providers", &infer::ExecutionBackendFactory::getAvailableProviders,
          "Execution providers reported by ONNX Runtime");

    // -------------------------------------------------------------------------
    // Alignment
    // -------------------------------------------------------------------------

    py::class_<infer::align::WordTiming>(m, "WordTiming", "Word-level timestamp")
        .def_readonly("word_index", &infer::align::WordTiming::word_index)
        .def_readonly("text", &infer::align::WordTiming::text)
        .def_readonly("start_time", &infer::align::WordTiming::start_time)
        .def_readonly("duration", &infer::align::WordTiming::duration)
        .def_readonly("confidence", &infer::align::WordTiming::confidence)
        .def_property_readonly("end_time", &infer::align::WordTiming::endTime)
        .def("__repr__", [](const infer::align::WordTiming& w) {
            return "WordTiming('" + w.text + "', " + std::to_string(w.start_time) +
                    "-" + std::to_string(w.endTime()) + "s)";
        });

    py::class_<infer::align::AlignmentResult>(m, "AlignmentResult", "Alignment result")
        .def_readonly("words", &infer::align::AlignmentResult::words)
        .def_readonly("total_duration", &infer::align::AlignmentResult::total_duration)
        .def_readonly("num_frames", &infer::align::AlignmentResult::num_frames)
        .def("word_at", [](const infer::align::AlignmentResult& r, double time)
                -> py::object {
            const auto* word = r.wordAt(time);
            if (!word) return py::none();
            return py::cast(*word);
        }, py::arg("time"))
        .def("is_valid", &infer::align::AlignmentResult::isValid);

    py::class_<infer::align::AlignerConfig>(m, "AlignerConfig", "Forced aligner configuration")
        .def(py::init<>())
        .def_readwrite("model_dir", &infer::align::AlignerConfig::model_dir)
        .def_readwrite("model_file", &infer::align::AlignerConfig::model_file)
        .def_readwrite("labels_file", &infer::align::AlignerConfig::labels_file)
        .def_readwrite("base_url", &infer::align::AlignerConfig::base_url)
        .def_readwrite("sample_rate", &infer::align::AlignerConfig::sample_rate)
        .def_readwrite("hop_size", &infer::align::AlignerConfig::hop_size)
        .def_readwrite("num_threads", &infer::align::AlignerConfig::num_threads)
        .def_readwrite("use_accelerator", &infer::align::AlignerConfig::use_accelerator)
        .def_readwrite("include_spaces", &infer::align::AlignerConfig::include_spaces);

    py::class_<infer::align::CtcTokenizer>(m, "CtcTokenizer", "CTC character tokenizer")
        .def(py::init<const std::vector<std::string>&>(), py::arg("labels"))
        .def("tokenize", &infer::align::CtcTokenizer::tokenize,
            py::arg("text"), py::arg("include_spaces") = true)
        .def("detokenize", &infer::align::CtcTokenizer::detokenize, py::arg("tokens"))
        .def_property_readonly("blank_index", &infer::align::CtcTokenizer::blankIndex)
        .def_property_readonly("vocab_size", &infer::align::CtcTokenizer::vocabSize);

    py::class_<infer::align::ForcedAligner>(m, "ForcedAligner", "CTC forced aligner")
        .def(py::init<>())
        .def(py::init<const infer::align::AlignerConfig&>(), py::arg("config"))
        .def("initialize", &infer::align::ForcedAligner::initialize,
            py::call_guard<py::gil_scoped_release>())
        .def("initialize_with_labels", &infer::align::ForcedAligner::initializeWithLabels,
            py::arg("labels"))
        .def("is_initialized", &infer::align::ForcedAligner::isInitialized)
        .def("align", [](infer::align::ForcedAligner& self, FloatArray audio,
                        const std::string& transcript) {
            if (audio.ndim() != 1) {
                throw std::runtime_error("Audio array must be 1-dimensional");
            }
            std::vector<float> samples(audio.data(), audio.data() + audio.size());

            infer::Result<infer::align::AlignmentResult> result;
            {
                py::gil_scoped_release release;
                result = self.align(samples, transcript);
            }
            if (!result) {
                throwError(result.error);
            }
            return result.value;
        }, py::arg("audio"), py::arg("transcript"))
        .def("align_file", [](infer::align::ForcedAligner& self, const std::string& path,
                            const std::string& transcript) {
            infer::Result<infer::align::AlignmentResult> result;
            {
                py::gil_scoped_release release;
                result = self.alignFile(path, transcript);
            }
            if (!result) {
                throwError(result.error);
            }
            return result.value;
        }, py::arg("path"), py::arg("transcript"))
        .def("align_emissions", [](const infer::align::ForcedAligner& self,
                                   const infer::align::Emissions& emissions,
                                   const std::string& transcript) {
            auto result = self.alignEmissions(emissions, transcript);
            if (!result) {
                throwError(result.error);
            }
            return result.value;
        }, py::arg("emissions"), py::arg("transcript"));

    // -------------------------------------------------------------------------
    // Module Info
    // -------------------------------------------------------------------------

    m.attr("__version__") = infer::getVersionString();
}
