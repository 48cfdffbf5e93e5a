#include <infergate/backend/mock_backend_handle.hpp>
#include <utility>

namespace infergate::backend {

MockBackendHandle::MockBackendHandle(core::BackendKind kind) : kind_(kind) {}

void MockBackendHandle::set_shape(std::optional<std::vector<std::int64_t>> shape) {
  shape_ = std::move(shape);
}

void MockBackendHandle::set_layout(core::TensorLayout layout) { layout_ = layout; }

void MockBackendHandle::set_accepts_images(bool accepts) { accepts_images_ = accepts; }

void MockBackendHandle::set_result(core::InferenceResult result) {
  result_ = std::move(result);
  error_.reset();
}

void MockBackendHandle::set_error(core::Error error) {
  error_ = std::move(error);
  result_.reset();
}

std::expected<core::InferenceResult, core::Error> MockBackendHandle::infer(
    const ModelInput& input, const InferOptions& options) const {
  {
    std::lock_guard lock(mutex_);
    ++calls_;
    last_input_ = input;
    last_options_ = options;
  }

  if (error_) return std::unexpected(*error_);
  if (result_) return *result_;

  if (const auto* tensor = std::get_if<core::Tensor>(&input)) return *tensor;
  if (const auto* text = std::get_if<core::TextTensor>(&input)) return *text;
  return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                          "mock backend has no result for an image input"));
}

std::size_t MockBackendHandle::call_count() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::optional<ModelInput> MockBackendHandle::last_input() const {
  std::lock_guard lock(mutex_);
  return last_input_;
}

InferOptions MockBackendHandle::last_options() const {
  std::lock_guard lock(mutex_);
  return last_options_;
}

}  // namespace infergate::backend
