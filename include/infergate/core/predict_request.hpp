#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace infergate::core {

/// Semantic input kind declared by the caller.
enum class InputKind {
  Numeric,
  Image,
  Csv,
  Json,
  Text,
  MultiText,
};

/// Semantic output kind declared by the caller. Json is the raw pass-through.
enum class OutputKind {
  Classification,
  Regression,
  Text,
  Image,
  Json,
};

[[nodiscard]] std::string_view input_kind_name(InputKind kind) noexcept;
[[nodiscard]] std::optional<InputKind> parse_input_kind(std::string_view name) noexcept;
[[nodiscard]] std::string_view output_kind_name(OutputKind kind) noexcept;
[[nodiscard]] std::optional<OutputKind> parse_output_kind(std::string_view name) noexcept;

/// Nested numeric sequence as received: a number, or a list of subtrees.
struct NumberTree {
  std::optional<double> leaf;
  std::vector<NumberTree> items;

  [[nodiscard]] bool is_leaf() const noexcept { return leaf.has_value(); }
};

/// Boundary request. Only the field matching input_type is consulted.
struct PredictRequest {
  std::string model_path;
  std::string model_key;
  InputKind input_type{InputKind::Numeric};
  OutputKind output_type{OutputKind::Classification};

  std::optional<NumberTree> inputs;               // numeric
  std::optional<std::string> image_base64;        // image
  std::optional<std::string> text;                // text
  std::optional<std::vector<std::string>> texts;  // multi_text
  std::optional<std::string> csv_data;            // csv
  std::optional<NumberTree> json_data;            // json
};

}  // namespace infergate::core
