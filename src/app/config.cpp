#include <infergate/app/config.hpp>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace infergate::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  throw std::invalid_argument("config: " + key + " expects a boolean, got '" + value + "'");
}

template <typename F>
auto convert(const std::string& key, const std::string& value, F parse) {
  try {
    return parse(value);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("config: invalid value '" + value + "' for " + key);
  }
}

}  // namespace

ServiceConfig default_config() {
  return ServiceConfig{};
}

ServiceConfig load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  const auto to_int = [](const std::string& v) { return std::stoi(v); };
  const auto to_int64 = [](const std::string& v) { return static_cast<std::int64_t>(std::stoll(v)); };
  const auto to_float = [](const std::string& v) { return std::stof(v); };

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "log_level") c.log_level = value;
    else if (key == "default_image_height") c.default_image_height = convert(key, value, to_int64);
    else if (key == "default_image_width") c.default_image_width = convert(key, value, to_int64);
    else if (key == "default_image_channels") c.default_image_channels = convert(key, value, to_int64);
    else if (key == "detection_confidence_threshold") c.detection_confidence_threshold = convert(key, value, to_float);
    else if (key == "detection_iou_threshold") c.detection_iou_threshold = convert(key, value, to_float);
    else if (key == "detection_input_size") c.detection_input_size = convert(key, value, to_int64);
    else if (key == "onnx_intra_op_threads") c.onnx_intra_op_threads = convert(key, value, to_int);
    else if (key == "torch_use_cuda") c.torch_use_cuda = parse_bool(key, value);
    else if (key == "batch_workers") c.batch_workers = convert(key, value, to_int);
    else if (key == "image_encoding") {
      const auto encoding = vision::parse_image_encoding(value);
      if (!encoding) {
        throw std::invalid_argument("config: image_encoding must be png or jpg, got '" + value + "'");
      }
      c.image_encoding = *encoding;
    }
  }
  return c;
}

backend::LoadOptions to_load_options(const ServiceConfig& config) {
  backend::LoadOptions options;
  options.onnx_intra_op_threads = config.onnx_intra_op_threads;
  options.torch_use_cuda = config.torch_use_cuda;
  options.detection_input_size = config.detection_input_size;
  options.detection_confidence_threshold = config.detection_confidence_threshold;
  options.detection_iou_threshold = config.detection_iou_threshold;
  options.annotated_encoding = config.image_encoding;
  return options;
}

preprocess::ImageDefaults to_image_defaults(const ServiceConfig& config) {
  return preprocess::ImageDefaults{config.default_image_height, config.default_image_width,
                                   config.default_image_channels};
}

}  // namespace infergate::app
