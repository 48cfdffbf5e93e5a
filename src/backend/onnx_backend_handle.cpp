#include <infergate/backend/onnx_backend_handle.hpp>
#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace infergate::backend {

namespace {

Ort::Env& shared_env() {
  static Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "infergate"};
  return env;
}

Ort::MemoryInfo cpu_memory_info() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

bool is_channel_count(std::int64_t d) { return d == 1 || d == 3 || d == 4; }

template <typename T>
std::vector<float> widen(const Ort::Value& value, std::size_t count) {
  const T* src = value.GetTensorData<T>();
  std::vector<float> out(count);
  for (std::size_t i = 0; i < count; ++i) {
    out[i] = static_cast<float>(src[i]);
  }
  return out;
}

template <typename T>
Ort::Value narrow_input(const core::Tensor& tensor, std::vector<T>& storage) {
  storage.resize(tensor.size());
  std::transform(tensor.values().begin(), tensor.values().end(), storage.begin(),
                 [](float v) { return static_cast<T>(v); });
  return Ort::Value::CreateTensor<T>(cpu_memory_info(), storage.data(), storage.size(),
                                     tensor.shape().data(), tensor.shape().size());
}

std::expected<core::InferenceResult, core::Error> convert_output(Ort::Value& out) {
  const auto info = out.GetTensorTypeAndShapeInfo();
  const std::vector<std::int64_t> shape = info.GetShape();
  const std::size_t count = info.GetElementCount();

  switch (info.GetElementType()) {
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT: {
      const float* src = out.GetTensorData<float>();
      return core::Tensor(shape, std::vector<float>(src, src + count));
    }
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE:
      return core::Tensor(shape, widen<double>(out, count));
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
      return core::Tensor(shape, widen<std::int64_t>(out, count));
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
      return core::Tensor(shape, widen<std::int32_t>(out, count));
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8:
      return core::Tensor(shape, widen<std::int8_t>(out, count));
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8:
      return core::Tensor(shape, widen<std::uint8_t>(out, count));
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL:
      return core::Tensor(shape, widen<bool>(out, count));
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING: {
      core::TextTensor text;
      text.shape = shape;
      text.values.reserve(count);
      for (std::size_t i = 0; i < count; ++i) {
        text.values.push_back(out.GetStringTensorElement(i));
      }
      return text;
    }
    default:
      return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                              "unsupported ONNX output element type"));
  }
}

}  // namespace

struct OnnxBackendHandle::Impl {
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;
  std::vector<std::int64_t> input_dims;
  ONNXTensorElementDataType input_type{ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT};
  core::TensorLayout layout{core::TensorLayout::ChannelsLast};
};

OnnxBackendHandle::OnnxBackendHandle(const std::filesystem::path& model_path,
                                     int intra_op_threads)
    : impl_(std::make_unique<Impl>()) {
  impl_->session_options.SetIntraOpNumThreads(std::max(intra_op_threads, 1));
  impl_->session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  impl_->session = Ort::Session(shared_env(), model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw LoadError("ONNX model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw LoadError("ONNX model has no outputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  const Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  impl_->input_dims = shape_info.GetShape();
  impl_->input_type = shape_info.GetElementType();

  const auto& dims = impl_->input_dims;
  if (dims.size() == 4u && is_channel_count(dims[1]) && !is_channel_count(dims[3])) {
    impl_->layout = core::TensorLayout::ChannelsFirst;
  }
  spdlog::debug("ONNX input '{}' {} ({}), output '{}'", impl_->input_name,
                core::shape_to_string(dims),
                impl_->layout == core::TensorLayout::ChannelsFirst ? "NCHW" : "NHWC",
                impl_->output_name);
}

OnnxBackendHandle::~OnnxBackendHandle() = default;

std::optional<std::vector<std::int64_t>> OnnxBackendHandle::shape() const {
  return impl_->input_dims;
}

core::TensorLayout OnnxBackendHandle::layout() const noexcept { return impl_->layout; }

const std::string& OnnxBackendHandle::input_name() const noexcept { return impl_->input_name; }

const std::string& OnnxBackendHandle::output_name() const noexcept { return impl_->output_name; }

std::expected<core::InferenceResult, core::Error> OnnxBackendHandle::infer(
    const ModelInput& input, const InferOptions& /*options*/) const {
  if (std::holds_alternative<core::Image>(input)) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            "ONNX backend does not take decoded images"));
  }

  try {
    Ort::Value input_tensor{nullptr};
    std::vector<double> double_storage;
    std::vector<std::int64_t> int64_storage;
    std::vector<std::int32_t> int32_storage;
    std::vector<const char*> string_ptrs;
    Ort::AllocatorWithDefaultOptions allocator;

    if (const auto* tensor = std::get_if<core::Tensor>(&input)) {
      switch (impl_->input_type) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE:
          input_tensor = narrow_input(*tensor, double_storage);
          break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
          input_tensor = narrow_input(*tensor, int64_storage);
          break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
          input_tensor = narrow_input(*tensor, int32_storage);
          break;
        default:
          // Session reads the buffer only; the const_cast never writes.
          input_tensor = Ort::Value::CreateTensor<float>(
              cpu_memory_info(), const_cast<float*>(tensor->data()), tensor->size(),
              tensor->shape().data(), tensor->shape().size());
          break;
      }
    } else {
      const auto& text = std::get<core::TextTensor>(input);
      input_tensor = Ort::Value::CreateTensor(allocator, text.shape.data(), text.shape.size(),
                                              ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING);
      string_ptrs.reserve(text.values.size());
      for (const auto& s : text.values) string_ptrs.push_back(s.c_str());
      input_tensor.FillStringTensor(string_ptrs.data(), string_ptrs.size());
    }

    const char* input_names[] = {impl_->input_name.c_str()};
    const char* output_names[] = {impl_->output_name.c_str()};
    Ort::RunOptions run_options;
    auto outputs = impl_->session.Run(run_options, input_names, &input_tensor, 1,
                                      output_names, 1);
    if (outputs.empty() || !outputs.front().IsTensor()) {
      return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                              "ONNX model produced no tensor output"));
    }
    return convert_output(outputs.front());
  } catch (const Ort::Exception& e) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            std::string("ONNX Runtime: ") + e.what()));
  } catch (const std::invalid_argument& e) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure, e.what()));
  }
}

std::string OnnxBackendHandle::runtime_version() {
  return OrtGetApiBase()->GetVersionString();
}

}  // namespace infergate::backend
