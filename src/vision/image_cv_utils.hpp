#pragma once

#include <infergate/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace infergate::vision::detail {

/// Non-owning cv::Mat view of an Image. Returns nullopt if format unsupported
/// or the buffer is too small for the declared dimensions.
std::optional<cv::Mat> image_to_mat(const infergate::core::Image& image);

/// Copy an 8-bit cv::Mat (1, 3 or 4 channels) into an Image; empty Image otherwise.
infergate::core::Image mat_to_image(const cv::Mat& mat);

}  // namespace infergate::vision::detail
