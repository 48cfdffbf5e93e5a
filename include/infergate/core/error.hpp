#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace infergate::core {

/// Failure taxonomy shared by every layer; used with std::expected for recoverable failures.
enum class ErrorCode {
  NotFound,            // artifact path missing
  ValidationError,     // request field absent, empty or malformed
  UnsupportedBackend,  // no backend kind can (or is built to) handle the artifact
  LoadFailure,         // artifact exists but fails to construct under every candidate kind
  InferenceFailure,    // backend raised during execution
};

/// Error code plus an internal message. The message may name paths or engine
/// details; the app layer decides what reaches the caller.
struct Error {
  ErrorCode code{ErrorCode::InferenceFailure};
  std::string message;
};

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

}  // namespace infergate::core
