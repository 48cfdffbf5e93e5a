#pragma once

#include <infergate/core/detection.hpp>
#include <infergate/core/tensor.hpp>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace infergate::core {

/// Encoded image payload (PNG or JPEG bytes) with its pixel dimensions.
struct EncodedImage {
  std::vector<std::uint8_t> bytes;
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Structured output of a detection backend. annotated is set only when the
/// caller asked for a rendered image.
struct DetectionResult {
  std::vector<Detection> detections;
  std::optional<EncodedImage> annotated;
};

/// Raw backend output: a dense tensor, a string tensor, or structured detections.
using InferenceResult = std::variant<Tensor, TextTensor, DetectionResult>;

}  // namespace infergate::core
