#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace infergate::backend {

/// TensorFlow C API handle (graph-model kind).
///
/// A regular file is imported as a frozen GraphDef; a directory is loaded as a
/// SavedModel with the "serve" tag. Keras archives (.h5, .keras) are rejected
/// with a LoadError diagnosis. Input is the first Placeholder named
/// "serving_default_*" (else the first Placeholder); output is
/// StatefulPartitionedCall:0 when present, else the last operation whose
/// first output has no consumers. Layout is channels-last.
class TensorFlowBackendHandle : public IBackendHandle {
 public:
  /// Throws LoadError on a Keras archive, missing Placeholder or TensorFlow status error.
  explicit TensorFlowBackendHandle(const std::filesystem::path& model_path);
  ~TensorFlowBackendHandle() override;

  TensorFlowBackendHandle(const TensorFlowBackendHandle&) = delete;
  TensorFlowBackendHandle& operator=(const TensorFlowBackendHandle&) = delete;

  [[nodiscard]] core::BackendKind kind() const noexcept override {
    return core::BackendKind::GraphModel;
  }
  [[nodiscard]] std::optional<std::vector<std::int64_t>> shape() const override;

  using IBackendHandle::infer;
  [[nodiscard]] std::expected<core::InferenceResult, core::Error> infer(
      const ModelInput& input, const InferOptions& options) const override;

  [[nodiscard]] static std::string runtime_version();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace infergate::backend
