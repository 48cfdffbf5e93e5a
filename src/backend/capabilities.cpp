#include <infergate/backend/capabilities.hpp>
#include <infergate/backend/onnx_backend_handle.hpp>
#ifdef INFERGATE_HAS_TENSORFLOW
#include <infergate/backend/tensorflow_backend_handle.hpp>
#endif
#ifdef INFERGATE_HAS_TORCH
#include <infergate/backend/torch_backend_handle.hpp>
#endif
#include <opencv2/core/utility.hpp>

namespace infergate::backend {

std::vector<BackendCapability> probe_capabilities() {
  std::vector<BackendCapability> caps;
  caps.push_back({core::BackendKind::PortableGraph, "onnxruntime",
                  OnnxBackendHandle::runtime_version()});
#ifdef INFERGATE_HAS_TENSORFLOW
  caps.push_back({core::BackendKind::GraphModel, "tensorflow",
                  TensorFlowBackendHandle::runtime_version()});
#endif
#ifdef INFERGATE_HAS_TORCH
  const std::string torch_version = TorchBackendHandle::runtime_version();
  caps.push_back({core::BackendKind::DynamicModel, "libtorch", torch_version});
  caps.push_back({core::BackendKind::DetectionModel, "libtorch", torch_version});
#endif
  return caps;
}

std::string opencv_version() { return cv::getVersionString(); }

}  // namespace infergate::backend
