#pragma once

#include <infergate/core/error.hpp>
#include <json/value.h>

namespace infergate::app {

/// NotFound -> 404, ValidationError -> 400, anything else -> 500.
[[nodiscard]] int http_status(core::ErrorCode code) noexcept;

/// {"detail": ...}: the precise message for 404/400, the fixed text
/// "Prediction failed" for 500 so engine details never reach the caller.
[[nodiscard]] Json::Value error_body(const core::Error& error);

}  // namespace infergate::app
