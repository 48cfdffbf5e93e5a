#include <infergate/backend/yolo_processing.hpp>
#include "vision/image_cv_utils.hpp"
#include <json/json.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <map>
#include <memory>
#include <stdexcept>

namespace infergate::backend {

namespace {

constexpr std::size_t kPreboxedValues = 6;

/// Undo letterbox on an x1,y1,x2,y2 box and clip to the original image.
core::BBox to_original(float x1, float y1, float x2, float y2, const LetterboxMeta& meta) {
  const float inv = meta.scale > 0.f ? 1.f / meta.scale : 1.f;
  const float w = static_cast<float>(meta.original_width);
  const float h = static_cast<float>(meta.original_height);
  core::BBox box;
  box.x1 = std::clamp((x1 - meta.pad_x) * inv, 0.f, w);
  box.y1 = std::clamp((y1 - meta.pad_y) * inv, 0.f, h);
  box.x2 = std::clamp((x2 - meta.pad_x) * inv, 0.f, w);
  box.y2 = std::clamp((y2 - meta.pad_y) * inv, 0.f, h);
  return box;
}

}  // namespace

std::optional<DetectionModelInfo> parse_detection_config(std::string_view json) {
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors) ||
      !root.isObject()) {
    return std::nullopt;
  }

  DetectionModelInfo info;
  if (root["task"].isString()) info.task = root["task"].asString();

  const Json::Value& names = root["names"];
  if (names.isArray()) {
    for (const auto& n : names) info.class_names.push_back(n.asString());
  } else if (names.isObject()) {
    std::map<long, std::string> by_index;
    for (const auto& key : names.getMemberNames()) {
      try {
        by_index[std::stol(key)] = names[key].asString();
      } catch (const std::exception&) {
        return std::nullopt;
      }
    }
    if (!by_index.empty() && by_index.begin()->first >= 0) {
      info.class_names.resize(static_cast<std::size_t>(by_index.rbegin()->first) + 1);
      for (auto& [idx, name] : by_index) {
        info.class_names[static_cast<std::size_t>(idx)] = std::move(name);
      }
    }
  }

  const Json::Value& imgsz = root["imgsz"];
  if (imgsz.isIntegral()) {
    info.input_height = info.input_width = imgsz.asInt64();
  } else if (imgsz.isArray() && imgsz.size() == 2u && imgsz[0].isIntegral() &&
             imgsz[1].isIntegral()) {
    info.input_height = imgsz[0].asInt64();
    info.input_width = imgsz[1].asInt64();
  }
  return info;
}

core::Tensor letterbox_to_tensor(const core::Image& image,
                                 std::int64_t size_h,
                                 std::int64_t size_w,
                                 LetterboxMeta& meta) {
  const auto mat = vision::detail::image_to_mat(image);
  if (!mat || mat->empty()) {
    throw std::invalid_argument("letterbox: empty or unsupported image");
  }
  if (size_h <= 0 || size_w <= 0) {
    throw std::invalid_argument("letterbox: target size must be positive");
  }

  cv::Mat bgr;
  if (mat->channels() == 1) {
    cv::cvtColor(*mat, bgr, cv::COLOR_GRAY2BGR);
  } else if (mat->channels() == 4) {
    cv::cvtColor(*mat, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = *mat;
  }

  meta.original_width = static_cast<std::uint32_t>(bgr.cols);
  meta.original_height = static_cast<std::uint32_t>(bgr.rows);

  const int target_w = static_cast<int>(size_w);
  const int target_h = static_cast<int>(size_h);
  const float scale = std::min(static_cast<float>(target_w) / static_cast<float>(bgr.cols),
                               static_cast<float>(target_h) / static_cast<float>(bgr.rows));
  const int new_w = std::max(1, static_cast<int>(std::round(bgr.cols * scale)));
  const int new_h = std::max(1, static_cast<int>(std::round(bgr.rows * scale)));

  cv::Mat resized;
  cv::resize(bgr, resized, cv::Size(new_w, new_h));

  const int pad_w = target_w - new_w;
  const int pad_h = target_h - new_h;
  const int pad_left = pad_w / 2;
  const int pad_top = pad_h / 2;
  cv::copyMakeBorder(resized, resized, pad_top, pad_h - pad_top, pad_left, pad_w - pad_left,
                     cv::BORDER_CONSTANT, cv::Scalar(114, 114, 114));

  meta.scale = scale;
  meta.pad_x = static_cast<float>(pad_left);
  meta.pad_y = static_cast<float>(pad_top);

  cv::Mat rgb;
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
  cv::Mat float_image;
  rgb.convertTo(float_image, CV_32F, 1.0 / 255.0);

  const std::size_t plane = static_cast<std::size_t>(target_h) * target_w;
  std::vector<float> packed(plane * 3);
  std::array<cv::Mat, 3> planes;
  cv::split(float_image, planes.data());
  for (std::size_t c = 0; c < 3; ++c) {
    const cv::Mat contiguous = planes[c].isContinuous() ? planes[c] : planes[c].clone();
    std::memcpy(packed.data() + c * plane, contiguous.ptr<float>(), plane * sizeof(float));
  }
  return core::Tensor({1, 3, size_h, size_w}, std::move(packed));
}

std::vector<core::Detection> decode_yolo_output(const core::Tensor& output,
                                                const LetterboxMeta& meta,
                                                const DetectionParams& params,
                                                std::size_t num_classes) {
  if (output.rank() != 3 || output.dim(0) != 1) {
    throw std::invalid_argument("YOLO output must have shape (1, C, N) or (1, N, C), got " +
                                core::shape_to_string(output.shape()));
  }
  const auto dim1 = static_cast<std::size_t>(output.dim(1));
  const auto dim2 = static_cast<std::size_t>(output.dim(2));
  const float* data = output.data();

  std::vector<core::Detection> detections;

  const bool preboxed = dim2 == kPreboxedValues && dim1 > dim2 && num_classes != 2;
  if (preboxed) {
    for (std::size_t i = 0; i < dim1; ++i) {
      const float* row = data + i * kPreboxedValues;
      if (!(row[4] >= params.confidence_threshold)) continue;  // also drops NaN
      core::Detection det;
      det.box = to_original(row[0], row[1], row[2], row[3], meta);
      det.confidence = row[4];
      det.class_id = static_cast<std::int32_t>(std::lround(row[5]));
      detections.push_back(std::move(det));
    }
    return non_max_suppression(std::move(detections), params.iou_threshold);
  }

  const bool channels_first = dim1 < dim2;
  const std::size_t channels = channels_first ? dim1 : dim2;
  const std::size_t anchors = channels_first ? dim2 : dim1;
  if (channels < 5) {
    throw std::invalid_argument("YOLO output has too few channels: " +
                                core::shape_to_string(output.shape()));
  }
  const std::size_t classes = channels - 4;

  for (std::size_t a = 0; a < anchors; ++a) {
    const auto read = [&](std::size_t c) {
      return channels_first ? data[c * anchors + a] : data[a * channels + c];
    };

    std::size_t best = 0;
    float best_score = read(4);
    for (std::size_t cls = 1; cls < classes; ++cls) {
      const float s = read(4 + cls);
      if (s > best_score || std::isnan(best_score)) {
        best_score = s;
        best = cls;
      }
    }
    if (!(best_score >= params.confidence_threshold)) continue;

    const float cx = read(0);
    const float cy = read(1);
    const float hw = read(2) * 0.5f;
    const float hh = read(3) * 0.5f;
    core::Detection det;
    det.box = to_original(cx - hw, cy - hh, cx + hw, cy + hh, meta);
    det.confidence = best_score;
    det.class_id = static_cast<std::int32_t>(best);
    detections.push_back(std::move(det));
  }
  return non_max_suppression(std::move(detections), params.iou_threshold);
}

float box_iou(const core::BBox& a, const core::BBox& b) noexcept {
  const float x1 = std::max(a.x1, b.x1);
  const float y1 = std::max(a.y1, b.y1);
  const float x2 = std::min(a.x2, b.x2);
  const float y2 = std::min(a.y2, b.y2);

  const float inter = std::max(0.f, x2 - x1) * std::max(0.f, y2 - y1);
  const float uni = a.width() * a.height() + b.width() * b.height() - inter;
  if (uni <= 0.f) return 0.f;
  return inter / uni;
}

std::vector<core::Detection> non_max_suppression(std::vector<core::Detection> detections,
                                                 float iou_threshold) {
  std::vector<core::Detection> kept;
  if (detections.empty()) return kept;

  std::stable_sort(detections.begin(), detections.end(),
                   [](const core::Detection& a, const core::Detection& b) {
                     // NaN orders last
                     if (std::isnan(b.confidence)) return !std::isnan(a.confidence);
                     return a.confidence > b.confidence;
                   });

  std::vector<bool> suppressed(detections.size(), false);
  for (std::size_t i = 0; i < detections.size(); ++i) {
    if (suppressed[i]) continue;
    kept.push_back(detections[i]);
    for (std::size_t j = i + 1; j < detections.size(); ++j) {
      if (suppressed[j] || detections[i].class_id != detections[j].class_id) continue;
      if (box_iou(detections[i].box, detections[j].box) > iou_threshold) {
        suppressed[j] = true;
      }
    }
  }
  return kept;
}

}  // namespace infergate::backend
