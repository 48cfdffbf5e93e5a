#pragma once

#include <infergate/vision/image_codec.hpp>
#include <cstdint>

namespace infergate::backend {

/// Engine settings applied when constructing backend handles.
struct LoadOptions {
  int onnx_intra_op_threads{1};
  bool torch_use_cuda{false};
  std::int64_t detection_input_size{640};
  float detection_confidence_threshold{0.25f};
  float detection_iou_threshold{0.45f};
  vision::ImageEncoding annotated_encoding{vision::ImageEncoding::Png};
};

}  // namespace infergate::backend
