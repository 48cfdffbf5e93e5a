#include <infergate/core/predict_request.hpp>

namespace infergate::core {

std::string_view input_kind_name(InputKind kind) noexcept {
  switch (kind) {
    case InputKind::Numeric:
      return "numeric";
    case InputKind::Image:
      return "image";
    case InputKind::Csv:
      return "csv";
    case InputKind::Json:
      return "json";
    case InputKind::Text:
      return "text";
    case InputKind::MultiText:
      return "multi_text";
  }
  return "unknown";
}

std::optional<InputKind> parse_input_kind(std::string_view name) noexcept {
  if (name == "numeric") return InputKind::Numeric;
  if (name == "image") return InputKind::Image;
  if (name == "csv") return InputKind::Csv;
  if (name == "json") return InputKind::Json;
  if (name == "text") return InputKind::Text;
  if (name == "multi_text") return InputKind::MultiText;
  return std::nullopt;
}

std::string_view output_kind_name(OutputKind kind) noexcept {
  switch (kind) {
    case OutputKind::Classification:
      return "classification";
    case OutputKind::Regression:
      return "regression";
    case OutputKind::Text:
      return "text";
    case OutputKind::Image:
      return "image";
    case OutputKind::Json:
      return "json";
  }
  return "unknown";
}

std::optional<OutputKind> parse_output_kind(std::string_view name) noexcept {
  if (name == "classification") return OutputKind::Classification;
  if (name == "regression") return OutputKind::Regression;
  if (name == "text") return OutputKind::Text;
  if (name == "image") return OutputKind::Image;
  if (name == "json") return OutputKind::Json;
  return std::nullopt;
}

}  // namespace infergate::core
