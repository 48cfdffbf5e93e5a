#include <infergate/vision/image_codec.hpp>
#include "vision/image_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

namespace infergate::vision {

std::optional<ImageEncoding> parse_image_encoding(std::string_view name) noexcept {
  if (name == "png") return ImageEncoding::Png;
  if (name == "jpg" || name == "jpeg") return ImageEncoding::Jpeg;
  return std::nullopt;
}

std::optional<core::Image> decode_image(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) return std::nullopt;

  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::uint8_t*>(bytes.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_ANYCOLOR);
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  if (mat.empty()) return std::nullopt;

  core::Image image = detail::mat_to_image(mat);
  if (image.empty()) return std::nullopt;
  return image;
}

std::optional<core::EncodedImage> encode_image(const core::Image& image,
                                               ImageEncoding encoding) {
  auto mat = detail::image_to_mat(image);
  if (!mat) return std::nullopt;

  cv::Mat to_encode = *mat;
  const std::string ext = encoding == ImageEncoding::Png ? ".png" : ".jpg";
  if (encoding == ImageEncoding::Jpeg && to_encode.channels() == 4) {
    cv::cvtColor(*mat, to_encode, cv::COLOR_BGRA2BGR);
  }

  std::vector<std::uint8_t> bytes;
  try {
    if (!cv::imencode(ext, to_encode, bytes)) return std::nullopt;
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  return core::EncodedImage{std::move(bytes), image.width(), image.height()};
}

}  // namespace infergate::vision
