#pragma once

#include <infergate/app/config.hpp>
#include <infergate/backend/backend_registry.hpp>
#include <infergate/backend/capabilities.hpp>
#include <infergate/backend/model_cache.hpp>
#include <infergate/core/error.hpp>
#include <infergate/core/predict_request.hpp>
#include <json/value.h>
#include <expected>
#include <memory>
#include <vector>

namespace infergate::app {

/// HTTP-equivalent outcome of one boundary request.
struct PredictResponse {
  int status{200};
  Json::Value body;
};

/// Wires cache, normalizers, backends and formatters together per request:
/// validate -> resolve handle -> normalize input -> infer -> format output.
///
/// Thread-safe: the model cache is the only shared mutable state.
class Dispatcher {
 public:
  /// Probes the engines compiled into this build once, for health().
  Dispatcher(std::shared_ptr<const backend::BackendRegistry> registry, ServiceConfig config);

  /// Response body with prediction, framework and kind-specific fields.
  /// Field validation runs before the artifact is touched; NotFound next.
  [[nodiscard]] std::expected<Json::Value, core::Error> predict(
      const core::PredictRequest& request);

  /// Parse, predict and map the outcome to a status and body. Failures other
  /// than 404/400 are logged with full detail and answered opaquely.
  [[nodiscard]] PredictResponse handle(const Json::Value& request);

  /// {status, cached_models, backends {tag: version}, opencv_version}.
  [[nodiscard]] Json::Value health() const;

  [[nodiscard]] const backend::ModelCache& cache() const noexcept { return cache_; }
  [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }

 private:
  ServiceConfig config_;
  backend::ModelCache cache_;
  std::vector<backend::BackendCapability> capabilities_;
};

}  // namespace infergate::app
