#include <infergate/preprocess/input_normalizer.hpp>
#include <infergate/core/base64.hpp>
#include <infergate/vision/image_codec.hpp>
#include <infergate/vision/image_ops.hpp>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>

namespace infergate::preprocess {

namespace {

core::Error validation(std::string message) {
  return core::make_error(core::ErrorCode::ValidationError, std::move(message));
}

/// Depth-first walk recording the shape of the first branch and checking every
/// other branch against it.
bool flatten(const core::NumberTree& node, std::size_t depth,
             std::vector<std::int64_t>& shape, std::vector<float>& values) {
  if (node.is_leaf()) {
    if (depth != shape.size()) return false;  // number where a list was expected
    values.push_back(static_cast<float>(*node.leaf));
    return true;
  }
  const auto n = static_cast<std::int64_t>(node.items.size());
  if (n == 0) return false;
  if (depth == shape.size()) {
    if (!values.empty()) return false;  // list where a number was expected
    shape.push_back(n);
  } else if (depth > shape.size() || shape[depth] != n) {
    return false;
  }
  for (const auto& child : node.items) {
    if (!flatten(child, depth + 1, shape, values)) return false;
  }
  return true;
}

std::expected<core::Tensor, core::Error> tree_to_tensor(const core::NumberTree& tree,
                                                        std::string_view field) {
  std::vector<std::int64_t> shape;
  std::vector<float> values;
  if (!flatten(tree, 0, shape, values)) {
    return std::unexpected(validation(std::string(field) +
                                      " must be a non-empty rectangular array of numbers"));
  }
  if (shape.empty()) {
    shape = {1, 1};
  } else if (shape.size() == 1) {
    shape.insert(shape.begin(), 1);
  }
  return core::Tensor(std::move(shape), std::move(values));
}

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::optional<float> parse_number(std::string_view cell) {
  const std::string text(trim(cell));
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  const float v = std::strtof(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE) return std::nullopt;
  return v;
}

std::vector<std::string_view> split(std::string_view line, char sep) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    const auto pos = line.find(sep, start);
    out.push_back(line.substr(start, pos == std::string_view::npos ? pos : pos - start));
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return out;
}

std::optional<std::vector<float>> parse_row(const std::vector<std::string_view>& cells) {
  std::vector<float> row;
  row.reserve(cells.size());
  for (const auto cell : cells) {
    const auto v = parse_number(cell);
    if (!v) return std::nullopt;
    row.push_back(*v);
  }
  return row;
}

bool positive(std::int64_t d) { return d > 0; }

/// (batch, declared[1:]...) when every non-batch dim is known and one example of
/// that size fits each of the input's `batch` rows exactly.
std::optional<std::vector<std::int64_t>> conform_shape(const std::vector<std::int64_t>& declared,
                                                       std::int64_t batch,
                                                       std::size_t count) {
  if (declared.empty() || count == 0 || !positive(batch)) return std::nullopt;
  std::int64_t per_example = 1;
  for (std::size_t i = 1; i < declared.size(); ++i) {
    if (!positive(declared[i])) return std::nullopt;
    per_example *= declared[i];
  }
  if (static_cast<std::size_t>(batch * per_example) != count) return std::nullopt;
  std::vector<std::int64_t> shape = declared;
  shape[0] = batch;
  return shape;
}

core::Error shape_mismatch(std::span<const std::int64_t> got,
                           std::span<const std::int64_t> declared) {
  return core::make_error(core::ErrorCode::InferenceFailure,
                          "input shape " + core::shape_to_string(got) +
                              " does not match model input " + core::shape_to_string(declared));
}

std::expected<backend::ModelInput, core::Error> conform(
    core::Tensor tensor, const std::optional<std::vector<std::int64_t>>& declared) {
  if (!declared || declared->empty() || declared->size() == tensor.rank()) {
    return std::move(tensor);
  }
  const std::int64_t batch = tensor.rank() == 0 ? 1 : tensor.dim(0);
  const auto shape = conform_shape(*declared, batch, tensor.size());
  if (!shape) return std::unexpected(shape_mismatch(tensor.shape(), *declared));
  return std::move(tensor).reshaped(*shape);
}

std::expected<backend::ModelInput, core::Error> conform(
    core::TextTensor text, const std::optional<std::vector<std::int64_t>>& declared) {
  if (!declared || declared->empty() || declared->size() == text.shape.size()) {
    return std::move(text);
  }
  auto shape = conform_shape(*declared, text.shape.empty() ? 1 : text.shape.front(),
                             text.values.size());
  if (!shape) return std::unexpected(shape_mismatch(text.shape, *declared));
  text.shape = std::move(*shape);
  return std::move(text);
}

template <typename T>
std::expected<backend::ModelInput, core::Error> conform_result(
    std::expected<T, core::Error> result,
    const std::optional<std::vector<std::int64_t>>& declared) {
  if (!result) return std::unexpected(std::move(result.error()));
  return conform(std::move(*result), declared);
}

}  // namespace

std::expected<core::Tensor, core::Error> normalize_numeric(const core::NumberTree& inputs) {
  return tree_to_tensor(inputs, "inputs");
}

std::expected<core::Tensor, core::Error> normalize_json(const core::NumberTree& data) {
  return tree_to_tensor(data, "json_data");
}

std::expected<core::Tensor, core::Error> normalize_csv(std::string_view csv) {
  std::vector<std::vector<std::string_view>> rows;
  for (const auto line : split(csv, '\n')) {
    if (trim(line).empty()) continue;
    rows.push_back(split(line, ','));
  }
  if (rows.empty()) return std::unexpected(validation("csv_data has no rows"));

  std::vector<float> values;
  std::size_t columns = 0;
  std::size_t data_rows = 0;
  for (std::size_t r = 0; r < rows.size(); ++r) {
    auto row = parse_row(rows[r]);
    if (!row) {
      if (r == 0) continue;  // header
      return std::unexpected(validation("csv_data row " + std::to_string(r + 1) +
                                        " is not numeric"));
    }
    if (data_rows == 0) {
      columns = row->size();
    } else if (row->size() != columns) {
      return std::unexpected(validation("csv_data row " + std::to_string(r + 1) + " has " +
                                        std::to_string(row->size()) + " columns, expected " +
                                        std::to_string(columns)));
    }
    values.insert(values.end(), row->begin(), row->end());
    ++data_rows;
  }
  if (data_rows == 0) return std::unexpected(validation("csv_data has no data rows"));

  return core::Tensor({static_cast<std::int64_t>(data_rows), static_cast<std::int64_t>(columns)},
                      std::move(values));
}

std::expected<core::Tensor, core::Error> normalize_image(
    std::string_view image_base64,
    const std::optional<std::vector<std::int64_t>>& declared_shape,
    core::TensorLayout layout,
    const ImageDefaults& defaults) {
  const auto bytes = core::base64_decode(image_base64);
  if (!bytes || bytes->empty()) {
    return std::unexpected(validation("image_base64 is not valid base64"));
  }
  const auto image = vision::decode_image(*bytes);
  if (!image) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            "image_base64 is not a decodable image"));
  }

  vision::ImageTensorSpec spec{defaults.height, defaults.width, defaults.channels, layout};
  bool drop_channel_axis = false;
  if (declared_shape && declared_shape->size() == 4u) {
    const auto& d = *declared_shape;
    const bool first = layout == core::TensorLayout::ChannelsFirst;
    const std::int64_t c = first ? d[1] : d[3];
    const std::int64_t h = first ? d[2] : d[1];
    const std::int64_t w = first ? d[3] : d[2];
    if (positive(h)) spec.height = h;
    if (positive(w)) spec.width = w;
    if (positive(c)) spec.channels = c;
  } else if (declared_shape && declared_shape->size() == 3u) {
    // (batch, H, W): single-channel model without a channel axis
    const auto& d = *declared_shape;
    if (positive(d[1])) spec.height = d[1];
    if (positive(d[2])) spec.width = d[2];
    spec.channels = 1;
    drop_channel_axis = true;
  }

  auto tensor = vision::image_to_tensor(*image, spec);
  if (!tensor) {
    return std::unexpected(core::make_error(
        core::ErrorCode::InferenceFailure,
        "cannot convert image to " + std::to_string(spec.channels) + " channels"));
  }
  if (drop_channel_axis) {
    return std::move(*tensor).reshaped({1, spec.height, spec.width});
  }
  return std::move(*tensor);
}

core::TextTensor normalize_text(std::string text) {
  core::TextTensor out;
  out.shape = {1};
  out.values.push_back(std::move(text));
  return out;
}

core::TextTensor normalize_texts(std::vector<std::string> texts) {
  core::TextTensor out;
  out.shape = {static_cast<std::int64_t>(texts.size())};
  out.values = std::move(texts);
  return out;
}

std::expected<void, core::Error> validate_request(const core::PredictRequest& request) {
  using core::InputKind;

  const auto missing = [&](std::string_view field) {
    return std::unexpected(validation(std::string(field) + " is required for input_type " +
                                      std::string(core::input_kind_name(request.input_type))));
  };
  const auto empty_tree = [](const std::optional<core::NumberTree>& t) {
    return !t || (!t->is_leaf() && t->items.empty());
  };

  switch (request.input_type) {
    case InputKind::Numeric:
      if (empty_tree(request.inputs)) return missing("inputs");
      break;
    case InputKind::Image:
      if (!request.image_base64 || trim(*request.image_base64).empty()) {
        return missing("image_base64");
      }
      break;
    case InputKind::Csv:
      if (!request.csv_data || trim(*request.csv_data).empty()) return missing("csv_data");
      break;
    case InputKind::Json:
      if (empty_tree(request.json_data)) return missing("json_data");
      break;
    case InputKind::Text:
      if (!request.text || request.text->empty()) return missing("text");
      break;
    case InputKind::MultiText:
      if (!request.texts || request.texts->empty()) return missing("texts");
      break;
  }
  return {};
}

std::expected<backend::ModelInput, core::Error> normalize_input(
    const core::PredictRequest& request,
    const backend::IBackendHandle& handle,
    const ImageDefaults& defaults) {
  if (auto valid = validate_request(request); !valid) {
    return std::unexpected(std::move(valid.error()));
  }

  using core::InputKind;
  const auto declared = handle.shape();

  switch (request.input_type) {
    case InputKind::Numeric:
      return conform_result(normalize_numeric(*request.inputs), declared);
    case InputKind::Json:
      return conform_result(normalize_json(*request.json_data), declared);
    case InputKind::Csv:
      return conform_result(normalize_csv(*request.csv_data), declared);
    case InputKind::Text:
      return conform(normalize_text(*request.text), declared);
    case InputKind::MultiText:
      return conform(normalize_texts(*request.texts), declared);
    case InputKind::Image:
      if (handle.accepts_images()) {
        const auto bytes = core::base64_decode(*request.image_base64);
        if (!bytes || bytes->empty()) {
          return std::unexpected(validation("image_base64 is not valid base64"));
        }
        auto image = vision::decode_image(*bytes);
        if (!image) {
          return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                                  "image_base64 is not a decodable image"));
        }
        return std::move(*image);
      }
      return conform_result(normalize_image(*request.image_base64, declared, handle.layout(),
                                            defaults),
                            declared);
  }
  return std::unexpected(validation("unknown input_type"));
}

}  // namespace infergate::preprocess
