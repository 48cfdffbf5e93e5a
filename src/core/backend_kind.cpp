#include <infergate/core/backend_kind.hpp>

namespace infergate::core {

std::string_view framework_tag(BackendKind kind) noexcept {
  switch (kind) {
    case BackendKind::GraphModel:
      return "tensorflow";
    case BackendKind::DynamicModel:
      return "pytorch";
    case BackendKind::DetectionModel:
      return "yolo";
    case BackendKind::PortableGraph:
      return "onnx";
  }
  return "unknown";
}

std::optional<BackendKind> backend_kind_from_tag(std::string_view tag) noexcept {
  if (tag == "tensorflow") return BackendKind::GraphModel;
  if (tag == "pytorch") return BackendKind::DynamicModel;
  if (tag == "yolo") return BackendKind::DetectionModel;
  if (tag == "onnx") return BackendKind::PortableGraph;
  return std::nullopt;
}

}  // namespace infergate::core
