#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace infergate::backend {

/// LibTorch TorchScript handle (dynamic-model kind).
///
/// shape() is nullopt: TorchScript does not declare its input shape. Inputs are
/// built channels-first. Only Tensor inputs are accepted.
class TorchBackendHandle : public IBackendHandle {
 public:
  /// Throws LoadError for weights-only dumps and non-archives, c10::Error from torch::jit::load.
  explicit TorchBackendHandle(const std::filesystem::path& model_path, bool use_cuda = false);
  ~TorchBackendHandle() override;

  TorchBackendHandle(const TorchBackendHandle&) = delete;
  TorchBackendHandle& operator=(const TorchBackendHandle&) = delete;

  [[nodiscard]] core::BackendKind kind() const noexcept override {
    return core::BackendKind::DynamicModel;
  }
  [[nodiscard]] std::optional<std::vector<std::int64_t>> shape() const override {
    return std::nullopt;
  }
  [[nodiscard]] core::TensorLayout layout() const noexcept override {
    return core::TensorLayout::ChannelsFirst;
  }

  using IBackendHandle::infer;
  [[nodiscard]] std::expected<core::InferenceResult, core::Error> infer(
      const ModelInput& input, const InferOptions& options) const override;

  [[nodiscard]] static std::string runtime_version();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace infergate::backend
