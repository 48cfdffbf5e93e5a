#include <infergate/app/dispatcher.hpp>
#include <infergate/app/http_status.hpp>
#include <infergate/app/predict_request.hpp>
#include <infergate/postprocess/output_formatter.hpp>
#include <infergate/preprocess/input_normalizer.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <string>
#include <utility>

namespace infergate::app {

Dispatcher::Dispatcher(std::shared_ptr<const backend::BackendRegistry> registry,
                       ServiceConfig config)
    : config_(std::move(config)),
      cache_(std::move(registry)),
      capabilities_(backend::probe_capabilities()) {
  for (const auto& cap : capabilities_) {
    spdlog::info("Backend available: {} ({} {})", core::framework_tag(cap.kind), cap.engine,
                 cap.version);
  }
}

std::expected<Json::Value, core::Error> Dispatcher::predict(const core::PredictRequest& request) {
  if (auto valid = preprocess::validate_request(request); !valid) {
    return std::unexpected(std::move(valid.error()));
  }

  auto handle = cache_.get_or_load(request.model_key, request.model_path);
  if (!handle) return std::unexpected(std::move(handle.error()));
  const backend::IBackendHandle& model = **handle;

  auto input = preprocess::normalize_input(request, model, to_image_defaults(config_));
  if (!input) return std::unexpected(std::move(input.error()));

  backend::InferOptions options;
  options.render_annotated = request.output_type == core::OutputKind::Image &&
                             model.kind() == core::BackendKind::DetectionModel;
  auto raw = model.infer(*input, options);
  if (!raw) return std::unexpected(std::move(raw.error()));

  auto body = postprocess::format_output(request.output_type, *raw,
                                         postprocess::FormatOptions{config_.image_encoding});
  if (!body) return std::unexpected(std::move(body.error()));
  (*body)["framework"] = std::string(core::framework_tag(model.kind()));
  return body;
}

PredictResponse Dispatcher::handle(const Json::Value& request) {
  std::expected<Json::Value, core::Error> outcome;
  std::string key = "<unparsed>";
  try {
    auto parsed = parse_predict_request(request);
    if (parsed) {
      key = parsed->model_key;
      outcome = predict(*parsed);
    } else {
      outcome = std::unexpected(std::move(parsed.error()));
    }
  } catch (const std::exception& e) {
    outcome = std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                               std::string("unhandled exception: ") + e.what()));
  }

  if (outcome) return PredictResponse{200, std::move(*outcome)};

  const core::Error& error = outcome.error();
  const int status = http_status(error.code);
  if (status == 500) {
    spdlog::error("Prediction for '{}' failed ({}): {}", key, core::error_code_name(error.code),
                  error.message);
  } else {
    spdlog::warn("Rejected request for '{}' ({}): {}", key, core::error_code_name(error.code),
                 error.message);
  }
  return PredictResponse{status, error_body(error)};
}

Json::Value Dispatcher::health() const {
  Json::Value body(Json::objectValue);
  body["status"] = "ok";
  body["cached_models"] = static_cast<Json::UInt64>(cache_.size());
  Json::Value backends(Json::objectValue);
  for (const auto& cap : capabilities_) {
    backends[std::string(core::framework_tag(cap.kind))] = cap.version;
  }
  body["backends"] = backends;
  body["opencv_version"] = backend::opencv_version();
  return body;
}

}  // namespace infergate::app
