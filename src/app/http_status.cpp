#include <infergate/app/http_status.hpp>
#include <string>

namespace infergate::app {

int http_status(core::ErrorCode code) noexcept {
  switch (code) {
    case core::ErrorCode::NotFound:
      return 404;
    case core::ErrorCode::ValidationError:
      return 400;
    default:
      return 500;
  }
}

Json::Value error_body(const core::Error& error) {
  Json::Value body(Json::objectValue);
  body["detail"] = http_status(error.code) == 500 ? std::string("Prediction failed") : error.message;
  return body;
}

}  // namespace infergate::app
