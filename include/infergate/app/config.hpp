#pragma once

#include <infergate/backend/load_options.hpp>
#include <infergate/preprocess/input_normalizer.hpp>
#include <infergate/vision/image_codec.hpp>
#include <cstdint>
#include <string>

namespace infergate::app {

/// Service configuration: logging, image defaults, engine and detection settings.
struct ServiceConfig {
  std::string log_level{"info"};
  std::int64_t default_image_height{224};
  std::int64_t default_image_width{224};
  std::int64_t default_image_channels{3};
  float detection_confidence_threshold{0.25f};
  float detection_iou_threshold{0.45f};
  std::int64_t detection_input_size{640};
  int onnx_intra_op_threads{1};
  bool torch_use_cuda{false};
  vision::ImageEncoding image_encoding{vision::ImageEncoding::Png};
  int batch_workers{0};  // 0: TBB default concurrency
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys are ignored; a malformed value throws std::invalid_argument naming the key.
ServiceConfig load_config(const std::string& path);

/// Default config when no file is provided.
ServiceConfig default_config();

/// Settings handed to backend handle constructors.
backend::LoadOptions to_load_options(const ServiceConfig& config);

preprocess::ImageDefaults to_image_defaults(const ServiceConfig& config);

}  // namespace infergate::app
