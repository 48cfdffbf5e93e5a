#include <infergate/postprocess/output_formatter.hpp>
#include <infergate/core/base64.hpp>
#include <infergate/vision/image_ops.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <span>
#include <string>
#include <vector>

namespace infergate::postprocess {

namespace {

constexpr std::size_t kTopK = 5;

bool is_channel_count(std::int64_t d) { return d == 1 || d == 3 || d == 4; }

/// Descending order with NaN after every number.
bool greater_nan_last(float a, float b) {
  if (std::isnan(b)) return !std::isnan(a);
  return a > b;
}

template <typename T, typename Leaf>
Json::Value nest(std::span<const std::int64_t> shape, const std::vector<T>& values,
                 std::size_t& pos, std::size_t axis, Leaf leaf) {
  if (axis == shape.size()) return leaf(values[pos++]);
  Json::Value arr(Json::arrayValue);
  for (std::int64_t i = 0; i < shape[axis]; ++i) {
    arr.append(nest(shape, values, pos, axis + 1, leaf));
  }
  return arr;
}

std::string mime_type(vision::ImageEncoding encoding) {
  return encoding == vision::ImageEncoding::Png ? "image/png" : "image/jpeg";
}

Json::Value image_size(std::uint32_t width, std::uint32_t height) {
  Json::Value size(Json::objectValue);
  size["width"] = width;
  size["height"] = height;
  return size;
}

core::Error not_an_image(const core::Tensor& output) {
  return core::make_error(core::ErrorCode::InferenceFailure,
                          "output shape " + core::shape_to_string(output.shape()) +
                              " cannot be rendered as an image");
}

}  // namespace

double round_confidence(double value) noexcept { return std::round(value * 10000.0) / 10000.0; }

Json::Value to_nested(const core::Tensor& tensor) {
  const std::vector<float> values(tensor.values().begin(), tensor.values().end());
  if (core::Tensor::element_count(tensor.shape()) != values.size()) {
    Json::Value flat(Json::arrayValue);
    for (const float v : values) flat.append(static_cast<double>(v));
    return flat;
  }
  std::size_t pos = 0;
  return nest(std::span<const std::int64_t>(tensor.shape()), values, pos, 0,
              [](float v) { return Json::Value(static_cast<double>(v)); });
}

Json::Value to_nested(const core::TextTensor& text) {
  if (core::Tensor::element_count(text.shape) != text.values.size()) {
    Json::Value flat(Json::arrayValue);
    for (const auto& s : text.values) flat.append(s);
    return flat;
  }
  std::size_t pos = 0;
  return nest(std::span<const std::int64_t>(text.shape), text.values, pos, 0,
              [](const std::string& s) { return Json::Value(s); });
}

Json::Value format_classification(const core::Tensor& output) {
  Json::Value body(Json::objectValue);
  body["prediction"] = to_nested(output);

  const std::size_t last =
      output.rank() == 0 ? 1u : static_cast<std::size_t>(output.shape().back());
  if (last == 0 || output.size() < last) return body;
  const auto row = output.values().first(last);

  if (last == 1) {
    const double p = row[0];
    const int cls = p >= 0.5 ? 1 : 0;
    body["predicted_class"] = cls;
    body["confidence"] = round_confidence(cls == 1 ? p : 1.0 - p);
    return body;
  }

  std::vector<std::size_t> order(last);
  std::iota(order.begin(), order.end(), 0u);
  std::stable_sort(order.begin(), order.end(), [&row](std::size_t a, std::size_t b) {
    return greater_nan_last(row[a], row[b]);
  });

  body["predicted_class"] = static_cast<Json::UInt64>(order.front());
  body["confidence"] = round_confidence(row[order.front()]);
  if (last > kTopK) {
    Json::Value top(Json::arrayValue);
    for (std::size_t i = 0; i < kTopK; ++i) {
      Json::Value entry(Json::objectValue);
      entry["class"] = static_cast<Json::UInt64>(order[i]);
      entry["confidence"] = round_confidence(row[order[i]]);
      top.append(entry);
    }
    body["top_5"] = top;
  }
  return body;
}

Json::Value format_regression(const core::Tensor& output) {
  Json::Value body(Json::objectValue);
  body["prediction"] = to_nested(output);
  if (output.size() == 1) {
    body["value"] = static_cast<double>(output.values()[0]);
  } else {
    Json::Value flat(Json::arrayValue);
    for (const float v : output.values()) flat.append(static_cast<double>(v));
    body["value"] = flat;
  }
  return body;
}

std::expected<Json::Value, core::Error> format_image(const core::Tensor& output,
                                                     vision::ImageEncoding encoding) {
  if (output.empty()) return std::unexpected(not_an_image(output));

  std::vector<std::int64_t> shape = output.shape();
  std::span<const float> values = output.values();
  if (shape.size() == 4) {  // batch: keep the first image
    const std::size_t per_image = core::Tensor::element_count(std::span(shape).subspan(1));
    values = values.first(per_image);
    shape.erase(shape.begin());
  }

  std::int64_t h = 0;
  std::int64_t w = 0;
  std::int64_t c = 1;
  bool channels_first = false;
  if (shape.size() == 2) {
    h = shape[0];
    w = shape[1];
  } else if (shape.size() == 3 && is_channel_count(shape[2])) {
    h = shape[0];
    w = shape[1];
    c = shape[2];
  } else if (shape.size() == 3 && is_channel_count(shape[0])) {
    c = shape[0];
    h = shape[1];
    w = shape[2];
    channels_first = true;
  } else {
    return std::unexpected(not_an_image(output));
  }
  if (h <= 0 || w <= 0) return std::unexpected(not_an_image(output));

  const float max_value = *std::max_element(values.begin(), values.end());
  const float scale = max_value <= 1.0f ? 255.0f : 1.0f;
  const auto plane = static_cast<std::size_t>(h * w);
  const auto channels = static_cast<std::size_t>(c);
  std::vector<float> hwc(values.size());
  for (std::size_t i = 0; i < plane; ++i) {
    for (std::size_t ch = 0; ch < channels; ++ch) {
      const float v = channels_first ? values[ch * plane + i] : values[i * channels + ch];
      hwc[i * channels + ch] = v * scale;
    }
  }

  const auto image = vision::image_from_pixels(hwc, static_cast<std::uint32_t>(h),
                                               static_cast<std::uint32_t>(w),
                                               static_cast<std::uint32_t>(c));
  if (!image) return std::unexpected(not_an_image(output));
  const auto encoded = vision::encode_image(*image, encoding);
  if (!encoded) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            "image encoding failed"));
  }

  Json::Value body(Json::objectValue);
  body["prediction"] = mime_type(encoding);
  body["image_base64"] = core::base64_encode(encoded->bytes);
  body["image_size"] = image_size(encoded->width, encoded->height);
  return body;
}

Json::Value format_raw(const core::Tensor& output) {
  Json::Value body(Json::objectValue);
  body["prediction"] = to_nested(output);
  return body;
}

Json::Value format_raw(const core::TextTensor& output) {
  Json::Value body(Json::objectValue);
  body["prediction"] = to_nested(output);
  return body;
}

Json::Value format_detections(const core::DetectionResult& result) {
  Json::Value list(Json::arrayValue);
  for (const auto& d : result.detections) {
    Json::Value entry(Json::objectValue);
    Json::Value box(Json::arrayValue);
    box.append(static_cast<double>(d.box.x1));
    box.append(static_cast<double>(d.box.y1));
    box.append(static_cast<double>(d.box.x2));
    box.append(static_cast<double>(d.box.y2));
    entry["box"] = box;
    entry["confidence"] = round_confidence(d.confidence);
    entry["class_id"] = d.class_id;
    if (d.class_name) entry["class_name"] = *d.class_name;
    list.append(entry);
  }

  Json::Value body(Json::objectValue);
  body["prediction"] = list;
  body["detections"] = list;
  body["count"] = static_cast<Json::UInt64>(result.detections.size());
  if (result.annotated) {
    body["image_base64"] = core::base64_encode(result.annotated->bytes);
    body["image_size"] = image_size(result.annotated->width, result.annotated->height);
  }
  return body;
}

std::expected<Json::Value, core::Error> format_output(core::OutputKind kind,
                                                      const core::InferenceResult& result,
                                                      const FormatOptions& options) {
  using core::OutputKind;

  if (const auto* detections = std::get_if<core::DetectionResult>(&result)) {
    return format_detections(*detections);
  }
  if (const auto* text = std::get_if<core::TextTensor>(&result)) {
    if (kind == OutputKind::Text || kind == OutputKind::Json) return format_raw(*text);
    return std::unexpected(core::make_error(
        core::ErrorCode::InferenceFailure,
        "string output cannot be formatted as " + std::string(core::output_kind_name(kind))));
  }

  const auto& tensor = std::get<core::Tensor>(result);
  switch (kind) {
    case OutputKind::Classification:
      return format_classification(tensor);
    case OutputKind::Regression:
      return format_regression(tensor);
    case OutputKind::Image:
      return format_image(tensor, options.image_encoding);
    case OutputKind::Text:
    case OutputKind::Json:
      return format_raw(tensor);
  }
  return format_raw(tensor);
}

}  // namespace infergate::postprocess
