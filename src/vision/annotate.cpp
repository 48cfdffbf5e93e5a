#include <infergate/vision/annotate.hpp>
#include "vision/image_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>
#include <string>

namespace infergate::vision {

namespace {

cv::Scalar class_colour(std::int32_t class_id) {
  // Spread hues so neighbouring ids differ visibly.
  const int hue = static_cast<int>((static_cast<std::uint32_t>(class_id) * 47u) % 180u);
  cv::Mat hsv(1, 1, CV_8UC3, cv::Scalar(hue, 220, 230));
  cv::Mat bgr;
  cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
  const auto px = bgr.at<cv::Vec3b>(0, 0);
  return cv::Scalar(px[0], px[1], px[2]);
}

std::string caption(const core::Detection& d) {
  char conf[16];
  std::snprintf(conf, sizeof(conf), "%.2f", static_cast<double>(d.confidence));
  const std::string label = d.class_name ? *d.class_name : std::to_string(d.class_id);
  return label + " " + conf;
}

}  // namespace

core::Image render_detections(const core::Image& image,
                              const std::vector<core::Detection>& detections) {
  auto view = detail::image_to_mat(image);
  if (!view) return core::Image();

  cv::Mat canvas;
  if (view->channels() == 1) {
    cv::cvtColor(*view, canvas, cv::COLOR_GRAY2BGR);
  } else {
    canvas = view->clone();
  }

  const int thickness = std::max(1, std::min(canvas.cols, canvas.rows) / 320);
  const double font_scale = 0.4 * thickness + 0.1;
  for (const auto& d : detections) {
    const cv::Scalar colour = class_colour(d.class_id);
    const cv::Point p1(static_cast<int>(d.box.x1), static_cast<int>(d.box.y1));
    const cv::Point p2(static_cast<int>(d.box.x2), static_cast<int>(d.box.y2));
    cv::rectangle(canvas, p1, p2, colour, thickness, cv::LINE_AA);

    const std::string text = caption(d);
    int baseline = 0;
    const cv::Size ts = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, font_scale, thickness, &baseline);
    const int top = std::max(0, p1.y - ts.height - baseline - 2);
    cv::rectangle(canvas, cv::Point(p1.x, top), cv::Point(p1.x + ts.width + 2, top + ts.height + baseline + 2),
                  colour, cv::FILLED);
    cv::putText(canvas, text, cv::Point(p1.x + 1, top + ts.height + 1), cv::FONT_HERSHEY_SIMPLEX,
                font_scale, cv::Scalar(255, 255, 255), thickness, cv::LINE_AA);
  }
  return detail::mat_to_image(canvas);
}

}  // namespace infergate::vision
