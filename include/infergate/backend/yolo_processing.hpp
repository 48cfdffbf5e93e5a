#pragma once

#include <infergate/core/detection.hpp>
#include <infergate/core/image.hpp>
#include <infergate/core/tensor.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace infergate::backend {

/// Mapping from the letterboxed model input back to the original image.
struct LetterboxMeta {
  std::uint32_t original_width{0};
  std::uint32_t original_height{0};
  float scale{1.f};
  float pad_x{0.f};
  float pad_y{0.f};
};

struct DetectionParams {
  float confidence_threshold{0.25f};
  float iou_threshold{0.45f};
};

/// Metadata a detection artifact carries about itself (extra/config.txt).
struct DetectionModelInfo {
  std::string task;
  std::vector<std::string> class_names;
  std::int64_t input_height{0};  // 0: not declared
  std::int64_t input_width{0};

  /// task == "detect", or no task but a class-name table.
  [[nodiscard]] bool is_detector() const noexcept {
    return task.empty() ? !class_names.empty() : task == "detect";
  }
};

/// Parse the JSON metadata blob. names may be an array or an object keyed by
/// class index strings; imgsz an int or [h, w]. nullopt on malformed JSON.
[[nodiscard]] std::optional<DetectionModelInfo> parse_detection_config(std::string_view json);

/// Letterbox (pad 114) to size_h x size_w, BGR->RGB, scale to [0,1], pack as
/// a (1, 3, size_h, size_w) tensor. Grayscale and BGRA inputs are converted to BGR first.
/// Throws std::invalid_argument on an empty or unsupported image.
[[nodiscard]] core::Tensor letterbox_to_tensor(const core::Image& image,
                                               std::int64_t size_h,
                                               std::int64_t size_w,
                                               LetterboxMeta& meta);

/// Decode a rank-3 YOLO output into boxes in original-image pixels, then apply
/// the confidence threshold and per-class NMS.
///
/// Accepted layouts (batch 1):
/// - raw (1, 4+nc, N) or (1, N, 4+nc): cx, cy, w, h, class scores;
/// - pre-boxed (1, N, 6): x1, y1, x2, y2, score, class.
/// num_classes disambiguates a raw 2-class (1, N, 6) output; pass 0 when unknown.
/// Throws std::invalid_argument on any other shape.
[[nodiscard]] std::vector<core::Detection> decode_yolo_output(const core::Tensor& output,
                                                              const LetterboxMeta& meta,
                                                              const DetectionParams& params,
                                                              std::size_t num_classes = 0);

[[nodiscard]] float box_iou(const core::BBox& a, const core::BBox& b) noexcept;

/// Greedy per-class NMS; returns survivors sorted by descending confidence.
[[nodiscard]] std::vector<core::Detection> non_max_suppression(
    std::vector<core::Detection> detections, float iou_threshold);

}  // namespace infergate::backend
