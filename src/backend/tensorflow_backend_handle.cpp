#include <infergate/backend/tensorflow_backend_handle.hpp>
#include <spdlog/spdlog.h>
#include <tensorflow/c/c_api.h>
#include <tensorflow/c/tf_tstring.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace infergate::backend {

namespace {

struct StatusDeleter {
  void operator()(TF_Status* s) const noexcept { TF_DeleteStatus(s); }
};
struct GraphDeleter {
  void operator()(TF_Graph* g) const noexcept { TF_DeleteGraph(g); }
};
struct SessionOptionsDeleter {
  void operator()(TF_SessionOptions* o) const noexcept { TF_DeleteSessionOptions(o); }
};
struct BufferDeleter {
  void operator()(TF_Buffer* b) const noexcept { TF_DeleteBuffer(b); }
};
struct ImportOptionsDeleter {
  void operator()(TF_ImportGraphDefOptions* o) const noexcept {
    TF_DeleteImportGraphDefOptions(o);
  }
};
struct TensorDeleter {
  void operator()(TF_Tensor* t) const noexcept { TF_DeleteTensor(t); }
};

using StatusPtr = std::unique_ptr<TF_Status, StatusDeleter>;
using GraphPtr = std::unique_ptr<TF_Graph, GraphDeleter>;
using TensorPtr = std::unique_ptr<TF_Tensor, TensorDeleter>;

constexpr std::string_view kServingPrefix = "serving_default_";
constexpr const char* kServingOutput = "StatefulPartitionedCall";

void throw_if_error(TF_Status* status, std::string_view context) {
  if (TF_GetCode(status) != TF_OK) {
    throw LoadError(std::string(context) + ": " + TF_Message(status));
  }
}

std::string lower_extension(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw LoadError("cannot open " + path.string());
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

TF_Output find_input(TF_Graph* graph) {
  TF_Operation* first = nullptr;
  std::size_t pos = 0;
  while (TF_Operation* op = TF_GraphNextOperation(graph, &pos)) {
    if (std::string_view(TF_OperationOpType(op)) != "Placeholder") continue;
    if (std::string_view(TF_OperationName(op)).starts_with(kServingPrefix)) {
      return TF_Output{op, 0};
    }
    if (!first) first = op;
  }
  if (!first) throw LoadError("graph has no Placeholder input");
  return TF_Output{first, 0};
}

TF_Output find_output(TF_Graph* graph) {
  if (TF_Operation* op = TF_GraphOperationByName(graph, kServingOutput)) {
    return TF_Output{op, 0};
  }
  TF_Operation* last = nullptr;
  std::size_t pos = 0;
  while (TF_Operation* op = TF_GraphNextOperation(graph, &pos)) {
    if (TF_OperationNumOutputs(op) == 0) continue;
    const std::string_view type = TF_OperationOpType(op);
    if (type == "Placeholder" || type == "Const" || type == "NoOp") continue;
    if (TF_OperationOutputNumConsumers(TF_Output{op, 0}) == 0) last = op;
  }
  if (!last) throw LoadError("graph has no unconsumed output");
  return TF_Output{last, 0};
}

template <typename T>
std::vector<float> widen(const TF_Tensor* t, std::size_t count) {
  const auto* src = static_cast<const T*>(TF_TensorData(t));
  std::vector<float> out(count);
  for (std::size_t i = 0; i < count; ++i) out[i] = static_cast<float>(src[i]);
  return out;
}

std::expected<core::InferenceResult, core::Error> convert_output(const TF_Tensor* t) {
  std::vector<std::int64_t> shape(static_cast<std::size_t>(TF_NumDims(t)));
  for (std::size_t i = 0; i < shape.size(); ++i) shape[i] = TF_Dim(t, static_cast<int>(i));
  const auto count = static_cast<std::size_t>(TF_TensorElementCount(t));

  switch (TF_TensorType(t)) {
    case TF_FLOAT:
      return core::Tensor(shape, widen<float>(t, count));
    case TF_DOUBLE:
      return core::Tensor(shape, widen<double>(t, count));
    case TF_INT32:
      return core::Tensor(shape, widen<std::int32_t>(t, count));
    case TF_INT64:
      return core::Tensor(shape, widen<std::int64_t>(t, count));
    case TF_UINT8:
      return core::Tensor(shape, widen<std::uint8_t>(t, count));
    case TF_BOOL:
      return core::Tensor(shape, widen<bool>(t, count));
    case TF_STRING: {
      const auto* strings = static_cast<const TF_TString*>(TF_TensorData(t));
      core::TextTensor text;
      text.shape = shape;
      text.values.reserve(count);
      for (std::size_t i = 0; i < count; ++i) {
        text.values.emplace_back(TF_StringGetDataPointer(&strings[i]),
                                 TF_StringGetSize(&strings[i]));
      }
      return text;
    }
    default:
      return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                              "unsupported TensorFlow output dtype"));
  }
}

}  // namespace

struct TensorFlowBackendHandle::Impl {
  GraphPtr graph{TF_NewGraph()};
  TF_Session* session{nullptr};
  TF_Output input{};
  TF_Output output{};
  TF_DataType input_type{TF_FLOAT};
  std::optional<std::vector<std::int64_t>> input_shape;

  ~Impl() {
    if (!session) return;
    StatusPtr status(TF_NewStatus());
    TF_CloseSession(session, status.get());
    TF_DeleteSession(session, status.get());
  }
};

TensorFlowBackendHandle::TensorFlowBackendHandle(const std::filesystem::path& model_path)
    : impl_(std::make_unique<Impl>()) {
  const std::string ext = lower_extension(model_path);
  if (ext == ".h5" || ext == ".keras") {
    throw LoadError("Keras archive; export it as a SavedModel directory or frozen .pb");
  }

  StatusPtr status(TF_NewStatus());
  std::unique_ptr<TF_SessionOptions, SessionOptionsDeleter> opts(TF_NewSessionOptions());

  if (std::filesystem::is_directory(model_path)) {
    const char* tags[] = {"serve"};
    impl_->session = TF_LoadSessionFromSavedModel(opts.get(), nullptr, model_path.c_str(), tags,
                                                  1, impl_->graph.get(), nullptr, status.get());
    throw_if_error(status.get(), "TF_LoadSessionFromSavedModel");
  } else {
    const std::string bytes = read_file(model_path);
    std::unique_ptr<TF_Buffer, BufferDeleter> graph_def(
        TF_NewBufferFromString(bytes.data(), bytes.size()));
    std::unique_ptr<TF_ImportGraphDefOptions, ImportOptionsDeleter> import_opts(
        TF_NewImportGraphDefOptions());
    TF_GraphImportGraphDef(impl_->graph.get(), graph_def.get(), import_opts.get(), status.get());
    throw_if_error(status.get(), "TF_GraphImportGraphDef");
    impl_->session = TF_NewSession(impl_->graph.get(), opts.get(), status.get());
    throw_if_error(status.get(), "TF_NewSession");
  }

  impl_->input = find_input(impl_->graph.get());
  impl_->output = find_output(impl_->graph.get());
  impl_->input_type = TF_OperationOutputType(impl_->input);

  const int num_dims = TF_GraphGetTensorNumDims(impl_->graph.get(), impl_->input, status.get());
  if (TF_GetCode(status.get()) == TF_OK && num_dims >= 0) {
    std::vector<std::int64_t> dims(static_cast<std::size_t>(num_dims));
    TF_GraphGetTensorShape(impl_->graph.get(), impl_->input, dims.data(), num_dims,
                           status.get());
    if (TF_GetCode(status.get()) == TF_OK) impl_->input_shape = std::move(dims);
  }

  spdlog::debug("TensorFlow input '{}' {}, output '{}'", TF_OperationName(impl_->input.oper),
                impl_->input_shape ? core::shape_to_string(*impl_->input_shape) : "unknown",
                TF_OperationName(impl_->output.oper));
}

TensorFlowBackendHandle::~TensorFlowBackendHandle() = default;

std::optional<std::vector<std::int64_t>> TensorFlowBackendHandle::shape() const {
  return impl_->input_shape;
}

std::expected<core::InferenceResult, core::Error> TensorFlowBackendHandle::infer(
    const ModelInput& input, const InferOptions& /*options*/) const {
  TensorPtr in;
  if (const auto* tensor = std::get_if<core::Tensor>(&input)) {
    const auto& dims = tensor->shape();
    if (impl_->input_type == TF_DOUBLE) {
      in.reset(TF_AllocateTensor(TF_DOUBLE, dims.data(), static_cast<int>(dims.size()),
                                 tensor->size() * sizeof(double)));
      auto* dst = static_cast<double*>(TF_TensorData(in.get()));
      std::copy(tensor->values().begin(), tensor->values().end(), dst);
    } else {
      in.reset(TF_AllocateTensor(TF_FLOAT, dims.data(), static_cast<int>(dims.size()),
                                 tensor->size() * sizeof(float)));
      std::memcpy(TF_TensorData(in.get()), tensor->data(), tensor->size() * sizeof(float));
    }
  } else if (const auto* text = std::get_if<core::TextTensor>(&input)) {
    in.reset(TF_AllocateTensor(TF_STRING, text->shape.data(), static_cast<int>(text->shape.size()),
                               text->values.size() * sizeof(TF_TString)));
    auto* dst = static_cast<TF_TString*>(TF_TensorData(in.get()));
    for (std::size_t i = 0; i < text->values.size(); ++i) {
      TF_StringInit(&dst[i]);
      TF_StringCopy(&dst[i], text->values[i].data(), text->values[i].size());
    }
  } else {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            "TensorFlow backend does not take decoded images"));
  }
  if (!in) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            "TF_AllocateTensor failed"));
  }

  StatusPtr status(TF_NewStatus());
  TF_Tensor* input_values[] = {in.get()};
  TF_Tensor* output_values[] = {nullptr};
  TF_SessionRun(impl_->session, nullptr, &impl_->input, input_values, 1, &impl_->output,
                output_values, 1, nullptr, 0, nullptr, status.get());
  TensorPtr out(output_values[0]);
  if (TF_GetCode(status.get()) != TF_OK) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            std::string("TF_SessionRun: ") +
                                                TF_Message(status.get())));
  }
  if (!out) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            "TF_SessionRun returned no output tensor"));
  }
  return convert_output(out.get());
}

std::string TensorFlowBackendHandle::runtime_version() { return TF_Version(); }

}  // namespace infergate::backend
