#pragma once

#include <infergate/core/backend_kind.hpp>
#include <infergate/core/image.hpp>
#include <infergate/core/tensor.hpp>
#include <cstdint>
#include <optional>
#include <span>

namespace infergate::vision {

/// Target geometry for an image tensor.
struct ImageTensorSpec {
  std::int64_t height{224};
  std::int64_t width{224};
  std::int64_t channels{3};  // 1: grayscale, 3: RGB, 4: RGBA
  core::TensorLayout layout{core::TensorLayout::ChannelsLast};
};

/// Convert colour mode to spec.channels, resize (bilinear), scale to [0,1] and
/// pack with a leading batch axis: (1, H, W, C) or (1, C, H, W).
/// Returns nullopt for an empty image or an unsupported channel count.
[[nodiscard]] std::optional<core::Tensor> image_to_tensor(const core::Image& image,
                                                          const ImageTensorSpec& spec);

/// Build an 8-bit image from interleaved HWC pixel values already in [0, 255]
/// (values are rounded and clamped). channels 1 yields Grayscale8; 3 and 4 are
/// taken as RGB / RGBA and stored as BGR8 / BGRA8. nullopt on a size mismatch.
[[nodiscard]] std::optional<core::Image> image_from_pixels(std::span<const float> hwc,
                                                           std::uint32_t height,
                                                           std::uint32_t width,
                                                           std::uint32_t channels);

}  // namespace infergate::vision
