#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace infergate::core {

/// Closed set of backend kinds an artifact can resolve to.
enum class BackendKind : std::uint8_t {
  GraphModel,      // TensorFlow frozen graph / SavedModel
  DynamicModel,    // TorchScript module
  DetectionModel,  // TorchScript YOLO-style detector
  PortableGraph,   // ONNX
};

/// Tensor layout a backend expects for image-like inputs.
enum class TensorLayout : std::uint8_t {
  ChannelsLast,   // batch, height, width, channels
  ChannelsFirst,  // batch, channels, height, width
};

/// Framework tag reported to callers ("tensorflow", "pytorch", "yolo", "onnx").
[[nodiscard]] std::string_view framework_tag(BackendKind kind) noexcept;

/// Inverse of framework_tag; nullopt for unknown tags.
[[nodiscard]] std::optional<BackendKind> backend_kind_from_tag(std::string_view tag) noexcept;

}  // namespace infergate::core
