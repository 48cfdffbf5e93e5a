#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <cstddef>
#include <mutex>
#include <optional>

namespace infergate::backend {

/// Handle that returns a configurable result (for tests/demo).
///
/// Configure with the setters before sharing the handle; infer() is then safe
/// to call concurrently. Without a configured result or error, infer() echoes
/// Tensor and TextTensor inputs back unchanged.
class MockBackendHandle : public IBackendHandle {
 public:
  explicit MockBackendHandle(core::BackendKind kind = core::BackendKind::PortableGraph);

  void set_shape(std::optional<std::vector<std::int64_t>> shape);
  void set_layout(core::TensorLayout layout);
  void set_accepts_images(bool accepts);
  void set_result(core::InferenceResult result);
  void set_error(core::Error error);

  [[nodiscard]] core::BackendKind kind() const noexcept override { return kind_; }
  [[nodiscard]] std::optional<std::vector<std::int64_t>> shape() const override {
    return shape_;
  }
  [[nodiscard]] core::TensorLayout layout() const noexcept override { return layout_; }
  [[nodiscard]] bool accepts_images() const noexcept override { return accepts_images_; }

  using IBackendHandle::infer;
  [[nodiscard]] std::expected<core::InferenceResult, core::Error> infer(
      const ModelInput& input, const InferOptions& options) const override;

  [[nodiscard]] std::size_t call_count() const;
  [[nodiscard]] std::optional<ModelInput> last_input() const;
  [[nodiscard]] InferOptions last_options() const;

 private:
  core::BackendKind kind_;
  std::optional<std::vector<std::int64_t>> shape_;
  core::TensorLayout layout_{core::TensorLayout::ChannelsLast};
  bool accepts_images_{false};
  std::optional<core::InferenceResult> result_;
  std::optional<core::Error> error_;

  mutable std::mutex mutex_;
  mutable std::size_t calls_{0};
  mutable std::optional<ModelInput> last_input_;
  mutable InferOptions last_options_;
};

}  // namespace infergate::backend
