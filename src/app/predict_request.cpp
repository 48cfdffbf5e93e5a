#include <infergate/app/predict_request.hpp>
#include <json/reader.h>
#include <memory>
#include <string>
#include <vector>

namespace infergate::app {

namespace {

core::Error invalid(std::string message) {
  return core::make_error(core::ErrorCode::ValidationError, std::move(message));
}

std::optional<core::NumberTree> to_number_tree(const Json::Value& value) {
  core::NumberTree node;
  if (value.isNumeric()) {
    node.leaf = value.asDouble();
    return node;
  }
  if (!value.isArray()) return std::nullopt;
  node.items.reserve(value.size());
  for (const auto& item : value) {
    auto child = to_number_tree(item);
    if (!child) return std::nullopt;
    node.items.push_back(std::move(*child));
  }
  return node;
}

std::expected<std::optional<std::string>, core::Error> optional_string(const Json::Value& json,
                                                                       const char* field) {
  const Json::Value& v = json[field];
  if (v.isNull()) return std::optional<std::string>{};
  if (!v.isString()) return std::unexpected(invalid(std::string(field) + " must be a string"));
  return std::optional<std::string>{v.asString()};
}

std::expected<std::optional<core::NumberTree>, core::Error> optional_numbers(
    const Json::Value& json, const char* field) {
  const Json::Value& v = json[field];
  if (v.isNull()) return std::optional<core::NumberTree>{};
  auto tree = to_number_tree(v);
  if (!tree) {
    return std::unexpected(invalid(std::string(field) + " must be a number or nested array of numbers"));
  }
  return std::optional<core::NumberTree>{std::move(*tree)};
}

}  // namespace

std::expected<Json::Value, core::Error> parse_json(std::string_view text) {
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return std::unexpected(invalid("request body is not valid JSON: " + errors));
  }
  return root;
}

std::expected<core::PredictRequest, core::Error> parse_predict_request(std::string_view text) {
  auto json = parse_json(text);
  if (!json) return std::unexpected(std::move(json.error()));
  return parse_predict_request(*json);
}

std::expected<core::PredictRequest, core::Error> parse_predict_request(const Json::Value& json) {
  if (!json.isObject()) return std::unexpected(invalid("request must be a JSON object"));

  core::PredictRequest request;
  for (const char* field : {"model_path", "model_key"}) {
    const Json::Value& v = json[field];
    if (!v.isString() || v.asString().empty()) {
      return std::unexpected(invalid(std::string(field) + " is required"));
    }
  }
  request.model_path = json["model_path"].asString();
  request.model_key = json["model_key"].asString();

  if (const Json::Value& v = json["input_type"]; !v.isNull()) {
    const auto kind = v.isString() ? core::parse_input_kind(v.asString()) : std::nullopt;
    if (!kind) return std::unexpected(invalid("unknown input_type"));
    request.input_type = *kind;
  }
  if (const Json::Value& v = json["output_type"]; !v.isNull()) {
    const auto kind = v.isString() ? core::parse_output_kind(v.asString()) : std::nullopt;
    if (!kind) return std::unexpected(invalid("unknown output_type"));
    request.output_type = *kind;
  }

  auto inputs = optional_numbers(json, "inputs");
  if (!inputs) return std::unexpected(std::move(inputs.error()));
  request.inputs = std::move(*inputs);

  auto json_data = optional_numbers(json, "json_data");
  if (!json_data) return std::unexpected(std::move(json_data.error()));
  request.json_data = std::move(*json_data);

  auto image = optional_string(json, "image_base64");
  if (!image) return std::unexpected(std::move(image.error()));
  request.image_base64 = std::move(*image);

  auto text = optional_string(json, "text");
  if (!text) return std::unexpected(std::move(text.error()));
  request.text = std::move(*text);

  auto csv = optional_string(json, "csv_data");
  if (!csv) return std::unexpected(std::move(csv.error()));
  request.csv_data = std::move(*csv);

  if (const Json::Value& v = json["texts"]; !v.isNull()) {
    if (!v.isArray()) return std::unexpected(invalid("texts must be an array of strings"));
    std::vector<std::string> texts;
    texts.reserve(v.size());
    for (const auto& item : v) {
      if (!item.isString()) return std::unexpected(invalid("texts must be an array of strings"));
      texts.push_back(item.asString());
    }
    request.texts = std::move(texts);
  }
  return request;
}

}  // namespace infergate::app
