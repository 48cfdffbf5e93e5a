#pragma once

#include <infergate/core/image.hpp>
#include <infergate/core/inference_result.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace infergate::vision {

/// Container format for encoded image payloads.
enum class ImageEncoding {
  Png,
  Jpeg,
};

[[nodiscard]] std::optional<ImageEncoding> parse_image_encoding(std::string_view name) noexcept;

/// Decode PNG/JPEG/BMP/... bytes into an Image (BGR8 or Grayscale8; alpha dropped).
/// Returns nullopt when the payload is not a decodable image.
[[nodiscard]] std::optional<core::Image> decode_image(std::span<const std::uint8_t> bytes);

/// Encode an Image (Grayscale8, BGR8 or BGRA8). Returns nullopt if the image is
/// empty or the encoder rejects it.
[[nodiscard]] std::optional<core::EncodedImage> encode_image(const core::Image& image,
                                                             ImageEncoding encoding);

}  // namespace infergate::vision
