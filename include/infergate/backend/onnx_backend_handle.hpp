#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace infergate::backend {

/// ONNX Runtime handle (portable-graph kind).
///
/// shape() reports the first declared input's dims (-1 for symbolic dims).
/// infer() feeds the tensor under the first input's name and returns the first
/// output. Float, double and integer outputs are widened to a float Tensor;
/// string outputs come back as a TextTensor. Images are not accepted.
///
/// Layout: NCHW when the declared input is rank 4 with dim 1 a channel count
/// (1, 3 or 4) and dim 3 not one; NHWC otherwise.
class OnnxBackendHandle : public IBackendHandle {
 public:
  /// Throws Ort::Exception on an unreadable model, LoadError if it has no inputs or outputs.
  explicit OnnxBackendHandle(const std::filesystem::path& model_path, int intra_op_threads = 1);
  ~OnnxBackendHandle() override;

  OnnxBackendHandle(const OnnxBackendHandle&) = delete;
  OnnxBackendHandle& operator=(const OnnxBackendHandle&) = delete;

  [[nodiscard]] core::BackendKind kind() const noexcept override {
    return core::BackendKind::PortableGraph;
  }
  [[nodiscard]] std::optional<std::vector<std::int64_t>> shape() const override;
  [[nodiscard]] core::TensorLayout layout() const noexcept override;

  using IBackendHandle::infer;
  [[nodiscard]] std::expected<core::InferenceResult, core::Error> infer(
      const ModelInput& input, const InferOptions& options) const override;

  [[nodiscard]] const std::string& input_name() const noexcept;
  [[nodiscard]] const std::string& output_name() const noexcept;

  /// ONNX Runtime version string.
  [[nodiscard]] static std::string runtime_version();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace infergate::backend
