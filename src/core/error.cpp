#include <infergate/core/error.hpp>

namespace infergate::core {

std::string_view error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::ValidationError:
      return "ValidationError";
    case ErrorCode::UnsupportedBackend:
      return "UnsupportedBackend";
    case ErrorCode::LoadFailure:
      return "LoadFailure";
    case ErrorCode::InferenceFailure:
      return "InferenceFailure";
  }
  return "Unknown";
}

}  // namespace infergate::core
