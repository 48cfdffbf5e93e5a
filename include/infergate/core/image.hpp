#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace infergate::core {

/// Memory: Image owns a single contiguous buffer (std::vector<std::byte>), rows
/// tightly packed; move semantics and RAII throughout. Use data() for views.
/// Thread-safety: distinct Image instances are independent.

/// Pixel layout of a decoded image.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  BGRA8,
};

/// Decoded image: dimensions, format and an owned pixel buffer. This is the
/// "raw decoded image object" detection backends accept in place of a tensor.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept { return channel_count(format_); }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  [[nodiscard]] static std::uint32_t channel_count(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace infergate::core
