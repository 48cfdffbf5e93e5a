#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <infergate/backend/load_options.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace infergate::backend {

/// TorchScript YOLO-style detector (detection-model kind).
///
/// Takes the decoded image directly and does its own letterbox preprocessing;
/// returns core::DetectionResult with boxes in original-image pixels and class
/// names from the archive's metadata. With InferOptions::render_annotated the
/// boxes are also drawn onto the image, which is returned encoded.
/// A (1, 3, H, W) Tensor input is accepted too (boxes are then in tensor pixels,
/// and rendering is unavailable).
class DetectionBackendHandle : public IBackendHandle {
 public:
  /// Throws LoadError when the archive is not a detection model.
  DetectionBackendHandle(const std::filesystem::path& model_path, const LoadOptions& options);
  ~DetectionBackendHandle() override;

  DetectionBackendHandle(const DetectionBackendHandle&) = delete;
  DetectionBackendHandle& operator=(const DetectionBackendHandle&) = delete;

  /// Capability check: a TorchScript archive whose extra/config.txt declares a
  /// detection task (or carries a class-name table without a task). Never throws.
  [[nodiscard]] static bool is_detection_artifact(const std::filesystem::path& path) noexcept;

  [[nodiscard]] core::BackendKind kind() const noexcept override {
    return core::BackendKind::DetectionModel;
  }
  [[nodiscard]] std::optional<std::vector<std::int64_t>> shape() const override;
  [[nodiscard]] core::TensorLayout layout() const noexcept override {
    return core::TensorLayout::ChannelsFirst;
  }
  [[nodiscard]] bool accepts_images() const noexcept override { return true; }

  using IBackendHandle::infer;
  [[nodiscard]] std::expected<core::InferenceResult, core::Error> infer(
      const ModelInput& input, const InferOptions& options) const override;

  [[nodiscard]] const std::vector<std::string>& class_names() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace infergate::backend
