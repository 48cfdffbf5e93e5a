#pragma once

#include <infergate/core/error.hpp>
#include <infergate/core/predict_request.hpp>
#include <json/value.h>
#include <expected>
#include <string_view>

namespace infergate::app {

/// Parse a boundary request object. model_path and model_key must be non-empty
/// strings, input_type / output_type known names (defaults: numeric,
/// classification), and present payload fields of the right JSON type.
/// Absent payload fields stay unset; validate_request checks them per input kind.
[[nodiscard]] std::expected<core::PredictRequest, core::Error> parse_predict_request(
    const Json::Value& json);

/// Parse JSON text; ValidationError if it is not a JSON object.
[[nodiscard]] std::expected<core::PredictRequest, core::Error> parse_predict_request(
    std::string_view text);

/// Parse JSON text into a value; ValidationError on a syntax error.
[[nodiscard]] std::expected<Json::Value, core::Error> parse_json(std::string_view text);

}  // namespace infergate::app
