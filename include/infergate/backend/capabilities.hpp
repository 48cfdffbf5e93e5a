#pragma once

#include <infergate/core/backend_kind.hpp>
#include <string>
#include <vector>

namespace infergate::backend {

/// One engine compiled into this build.
struct BackendCapability {
  core::BackendKind kind{core::BackendKind::PortableGraph};
  std::string engine;   // e.g. "onnxruntime"
  std::string version;  // engine runtime version string
};

/// Probe the engines built into this process. Cheap; call once at startup.
[[nodiscard]] std::vector<BackendCapability> probe_capabilities();

/// OpenCV version used for image decoding and encoding.
[[nodiscard]] std::string opencv_version();

}  // namespace infergate::backend
