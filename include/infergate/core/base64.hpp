#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace infergate::core {

/// Standard alphabet with '=' padding.
[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> bytes);

/// Decode standard base64. Whitespace is skipped and an optional
/// "data:<mime>;base64," prefix is stripped. Returns nullopt on malformed input.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text);

}  // namespace infergate::core
