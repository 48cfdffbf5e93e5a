#include "vision/image_cv_utils.hpp"
#include <infergate/core/image.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace infergate::vision::detail {

namespace ic = infergate::core;

std::optional<cv::Mat> image_to_mat(const ic::Image& image) {
  if (image.empty()) return std::nullopt;
  if (image.size_bytes() < ic::Image::min_bytes(image.width(), image.height(), image.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  auto* ptr = const_cast<std::byte*>(image.data().data());

  switch (image.format()) {
    case ic::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, ptr);
    case ic::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, ptr);
    case ic::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, ptr);
    case ic::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

ic::Image mat_to_image(const cv::Mat& mat) {
  if (mat.empty() || mat.depth() != CV_8U) return ic::Image();

  ic::PixelFormat format = ic::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1:
      format = ic::PixelFormat::Grayscale8;
      break;
    case 3:
      format = ic::PixelFormat::BGR8;
      break;
    case 4:
      format = ic::PixelFormat::BGRA8;
      break;
    default:
      return ic::Image();
  }

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return ic::Image(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

}  // namespace infergate::vision::detail
