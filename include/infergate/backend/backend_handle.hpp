#pragma once

#include <infergate/core/backend_kind.hpp>
#include <infergate/core/error.hpp>
#include <infergate/core/image.hpp>
#include <infergate/core/inference_result.hpp>
#include <infergate/core/tensor.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace infergate::backend {

/// What a normalizer hands to a backend: a canonical tensor, a string tensor, or
/// (for backends that accept_images()) the decoded image itself.
using ModelInput = std::variant<core::Tensor, core::TextTensor, core::Image>;

/// Per-call switches derived from the requested output kind.
struct InferOptions {
  /// Detection backends: return a rendered annotated image alongside the detections.
  bool render_annotated{false};
};

/// Thrown by handle constructors when an artifact exists but is not loadable by
/// that backend, with a diagnosis (e.g. weights-only dump, Keras archive).
class LoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// One loaded artifact plus the backend kind that produced it.
///
/// Immutable after construction: shape() and layout() never change and infer()
/// is const and safe to call from several threads concurrently. Constructors
/// throw on load failure; infer() reports failures as InferenceFailure.
class IBackendHandle {
 public:
  virtual ~IBackendHandle() = default;

  [[nodiscard]] virtual core::BackendKind kind() const noexcept = 0;

  /// Declared input shape (unresolved dims are -1), or nullopt when the backend
  /// cannot discover it statically.
  [[nodiscard]] virtual std::optional<std::vector<std::int64_t>> shape() const = 0;

  /// Layout image tensors must be built in. Default: channels-last.
  [[nodiscard]] virtual core::TensorLayout layout() const noexcept {
    return core::TensorLayout::ChannelsLast;
  }

  /// True if infer() takes a decoded core::Image directly (detection backends).
  [[nodiscard]] virtual bool accepts_images() const noexcept { return false; }

  [[nodiscard]] virtual std::expected<core::InferenceResult, core::Error> infer(
      const ModelInput& input, const InferOptions& options) const = 0;

  [[nodiscard]] std::expected<core::InferenceResult, core::Error> infer(
      const ModelInput& input) const {
    return infer(input, InferOptions{});
  }
};

}  // namespace infergate::backend
