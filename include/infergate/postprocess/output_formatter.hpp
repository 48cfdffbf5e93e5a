#pragma once

#include <infergate/core/error.hpp>
#include <infergate/core/inference_result.hpp>
#include <infergate/core/predict_request.hpp>
#include <infergate/core/tensor.hpp>
#include <infergate/vision/image_codec.hpp>
#include <json/value.h>
#include <expected>

namespace infergate::postprocess {

struct FormatOptions {
  vision::ImageEncoding image_encoding{vision::ImageEncoding::Png};
};

/// Round to 4 decimal places (confidence reporting).
[[nodiscard]] double round_confidence(double value) noexcept;

/// Nested JSON arrays following the tensor's shape; a rank-0 tensor is a bare number.
[[nodiscard]] Json::Value to_nested(const core::Tensor& tensor);
[[nodiscard]] Json::Value to_nested(const core::TextTensor& text);

/// prediction plus, from the first row of the last axis:
/// - length > 1: predicted_class / confidence from argmax, and top_5 when length > 5;
/// - length 1: the value as a probability binarised at >= 0.5, confidence being
///   the probability of the chosen class.
[[nodiscard]] Json::Value format_classification(const core::Tensor& output);

/// prediction plus value: a scalar when exactly one value results, else the flat list.
[[nodiscard]] Json::Value format_regression(const core::Tensor& output);

/// Encode the tensor as an image: values <= 1 are scaled by 255, a leading
/// batch axis and a trailing single channel are dropped, and (C, H, W) data is
/// transposed to (H, W, C). Sets image_base64 and image_size; prediction is
/// the image MIME type. InferenceFailure when the shape is not image-like.
[[nodiscard]] std::expected<Json::Value, core::Error> format_image(const core::Tensor& output,
                                                                  vision::ImageEncoding encoding);

/// prediction as the nested values, no interpretation.
[[nodiscard]] Json::Value format_raw(const core::Tensor& output);
[[nodiscard]] Json::Value format_raw(const core::TextTensor& output);

/// detections [{box, confidence, class_id, class_name?}], count, prediction
/// (the detection list) and, when rendered, image_base64 / image_size.
[[nodiscard]] Json::Value format_detections(const core::DetectionResult& result);

/// Dispatch on the output kind. Detection results bypass the kind and go
/// through format_detections; string outputs only format as text or json.
[[nodiscard]] std::expected<Json::Value, core::Error> format_output(
    core::OutputKind kind, const core::InferenceResult& result, const FormatOptions& options = {});

}  // namespace infergate::postprocess
