#pragma once

#include <infergate/core/detection.hpp>
#include <infergate/core/image.hpp>
#include <vector>

namespace infergate::vision {

/// Draw each detection's box and "<label> <confidence>" caption onto a copy of
/// image. Colours are stable per class id. Grayscale input is promoted to BGR8.
[[nodiscard]] core::Image render_detections(const core::Image& image,
                                            const std::vector<core::Detection>& detections);

}  // namespace infergate::vision
