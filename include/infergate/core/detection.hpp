#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace infergate::core {

/// Axis-aligned box in pixel coordinates of the image the caller supplied.
struct BBox {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};

  [[nodiscard]] float width() const noexcept { return x2 - x1; }
  [[nodiscard]] float height() const noexcept { return y2 - y1; }
};

/// Single detection: box, confidence, class id and optional human-readable class name.
struct Detection {
  BBox box{};
  float confidence{0.f};
  std::int32_t class_id{0};
  std::optional<std::string> class_name;
};

}  // namespace infergate::core
