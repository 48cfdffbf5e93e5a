#include <infergate/vision/image_ops.hpp>
#include "vision/image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstring>
#include <vector>

namespace infergate::vision {

namespace {

int conversion_code(int from_channels, std::int64_t to_channels) {
  switch (to_channels) {
    case 1:
      if (from_channels == 3) return cv::COLOR_BGR2GRAY;
      if (from_channels == 4) return cv::COLOR_BGRA2GRAY;
      return -1;
    case 3:
      if (from_channels == 1) return cv::COLOR_GRAY2RGB;
      if (from_channels == 3) return cv::COLOR_BGR2RGB;
      if (from_channels == 4) return cv::COLOR_BGRA2RGB;
      return -1;
    case 4:
      if (from_channels == 1) return cv::COLOR_GRAY2RGBA;
      if (from_channels == 3) return cv::COLOR_BGR2RGBA;
      if (from_channels == 4) return cv::COLOR_BGRA2RGBA;
      return -1;
    default:
      return -1;
  }
}

}  // namespace

std::optional<core::Tensor> image_to_tensor(const core::Image& image,
                                            const ImageTensorSpec& spec) {
  auto mat_in = detail::image_to_mat(image);
  if (!mat_in || spec.height <= 0 || spec.width <= 0) return std::nullopt;

  cv::Mat converted;
  const int code = conversion_code(mat_in->channels(), spec.channels);
  if (code >= 0) {
    cv::cvtColor(*mat_in, converted, code);
  } else if (mat_in->channels() == spec.channels) {
    converted = *mat_in;
  } else {
    return std::nullopt;
  }

  const int h = static_cast<int>(spec.height);
  const int w = static_cast<int>(spec.width);
  cv::Mat resized;
  if (converted.rows == h && converted.cols == w) {
    resized = converted;
  } else {
    cv::resize(converted, resized, cv::Size(w, h), 0, 0, cv::INTER_LINEAR);
  }

  cv::Mat mat_float;
  resized.convertTo(mat_float, CV_32FC(resized.channels()), 1.0 / 255.0);
  if (!mat_float.isContinuous()) mat_float = mat_float.clone();

  const auto c = static_cast<std::size_t>(spec.channels);
  const std::size_t plane = static_cast<std::size_t>(h) * w;
  std::vector<float> values(plane * c);
  const float* hwc = mat_float.ptr<float>();

  if (spec.layout == core::TensorLayout::ChannelsFirst) {
    for (std::size_t i = 0; i < plane; ++i) {
      for (std::size_t ch = 0; ch < c; ++ch) {
        values[ch * plane + i] = hwc[i * c + ch];
      }
    }
    return core::Tensor({1, spec.channels, spec.height, spec.width}, std::move(values));
  }
  std::memcpy(values.data(), hwc, values.size() * sizeof(float));
  return core::Tensor({1, spec.height, spec.width, spec.channels}, std::move(values));
}

std::optional<core::Image> image_from_pixels(std::span<const float> hwc,
                                             std::uint32_t height,
                                             std::uint32_t width,
                                             std::uint32_t channels) {
  if (height == 0 || width == 0) return std::nullopt;
  if (channels != 1 && channels != 3 && channels != 4) return std::nullopt;
  if (hwc.size() != static_cast<std::size_t>(height) * width * channels) return std::nullopt;

  const cv::Mat as_float(static_cast<int>(height), static_cast<int>(width),
                         CV_32FC(static_cast<int>(channels)), const_cast<float*>(hwc.data()));
  cv::Mat pixels;
  as_float.convertTo(pixels, CV_8UC(static_cast<int>(channels)));  // saturating round

  if (channels == 3) {
    cv::cvtColor(pixels, pixels, cv::COLOR_RGB2BGR);
  } else if (channels == 4) {
    cv::cvtColor(pixels, pixels, cv::COLOR_RGBA2BGRA);
  }
  core::Image image = detail::mat_to_image(pixels);
  if (image.empty()) return std::nullopt;
  return image;
}

}  // namespace infergate::vision
