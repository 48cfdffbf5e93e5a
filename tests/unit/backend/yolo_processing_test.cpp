#include <infergate/backend/yolo_processing.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <vector>

namespace ib = infergate::backend;
namespace ic = infergate::core;

namespace {

ic::Image solid_bgr(std::uint32_t w, std::uint32_t h, std::uint8_t value) {
  std::vector<std::byte> buf(ic::Image::min_bytes(w, h, ic::PixelFormat::BGR8),
                             static_cast<std::byte>(value));
  return ic::Image(w, h, ic::PixelFormat::BGR8, std::move(buf));
}

ib::LetterboxMeta identity_meta(std::uint32_t w, std::uint32_t h) {
  ib::LetterboxMeta meta;
  meta.original_width = w;
  meta.original_height = h;
  return meta;
}

}  // namespace

TEST(ParseDetectionConfig, NamesAsObjectAndSquareImgsz) {
  auto info = ib::parse_detection_config(
      R"({"task": "detect", "names": {"0": "person", "2": "car", "1": "bicycle"}, "imgsz": 320})");
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->is_detector());
  ASSERT_EQ(info->class_names.size(), 3u);
  EXPECT_EQ(info->class_names[1], "bicycle");
  EXPECT_EQ(info->class_names[2], "car");
  EXPECT_EQ(info->input_height, 320);
  EXPECT_EQ(info->input_width, 320);
}

TEST(ParseDetectionConfig, NamesAsArrayAndRectangularImgsz) {
  auto info = ib::parse_detection_config(R"({"names": ["a", "b"], "imgsz": [480, 640]})");
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->is_detector());
  EXPECT_EQ(info->input_height, 480);
  EXPECT_EQ(info->input_width, 640);
}

TEST(ParseDetectionConfig, OtherTasksAreNotDetectors) {
  auto info = ib::parse_detection_config(R"({"task": "classify", "names": ["a"]})");
  ASSERT_TRUE(info.has_value());
  EXPECT_FALSE(info->is_detector());
  EXPECT_FALSE(ib::parse_detection_config("not json").has_value());
  EXPECT_FALSE(ib::parse_detection_config("[1, 2]").has_value());
}

TEST(Letterbox, PadsAndScalesToTarget) {
  ib::LetterboxMeta meta;
  auto tensor = ib::letterbox_to_tensor(solid_bgr(200, 100, 255), 64, 64, meta);
  EXPECT_EQ(tensor.shape(), (std::vector<std::int64_t>{1, 3, 64, 64}));
  EXPECT_EQ(meta.original_width, 200u);
  EXPECT_EQ(meta.original_height, 100u);
  EXPECT_FLOAT_EQ(meta.scale, 0.32f);
  EXPECT_FLOAT_EQ(meta.pad_x, 0.f);
  EXPECT_FLOAT_EQ(meta.pad_y, 16.f);
  // Top-left is padding (114), the center is image content (255).
  EXPECT_NEAR(tensor.values()[0], 114.f / 255.f, 1e-5f);
  EXPECT_NEAR(tensor.values()[32 * 64 + 32], 1.f, 1e-5f);
}

TEST(Letterbox, RejectsEmptyImage) {
  ib::LetterboxMeta meta;
  EXPECT_THROW((void)ib::letterbox_to_tensor(ic::Image{}, 64, 64, meta), std::invalid_argument);
}

TEST(DecodeYolo, RawChannelsFirstPicksBestClass) {
  // (1, 4 + 2 classes, 8 anchors), channel-major; anchors past the first three are empty.
  constexpr std::size_t kAnchors = 8;
  std::vector<float> values(6 * kAnchors, 0.f);
  const auto set = [&](std::size_t channel, std::size_t anchor, float v) {
    values[channel * kAnchors + anchor] = v;
  };
  // anchor: cx, cy, w, h, class 0, class 1
  const float anchors[3][6] = {
      {50.f, 50.f, 20.f, 20.f, 0.1f, 0.8f},
      {10.f, 10.f, 4.f, 4.f, 0.9f, 0.0f},
      {80.f, 80.f, 10.f, 10.f, 0.05f, 0.1f},
  };
  for (std::size_t a = 0; a < 3; ++a) {
    for (std::size_t c = 0; c < 6; ++c) set(c, a, anchors[a][c]);
  }
  ic::Tensor out({1, 6, static_cast<std::int64_t>(kAnchors)}, values);
  auto dets = ib::decode_yolo_output(out, identity_meta(100, 100), {}, 2);
  ASSERT_EQ(dets.size(), 2u);
  EXPECT_EQ(dets[0].class_id, 0);
  EXPECT_FLOAT_EQ(dets[0].confidence, 0.9f);
  EXPECT_FLOAT_EQ(dets[0].box.x1, 8.f);
  EXPECT_FLOAT_EQ(dets[0].box.x2, 12.f);
  EXPECT_EQ(dets[1].class_id, 1);
  EXPECT_FLOAT_EQ(dets[1].box.x1, 40.f);
  EXPECT_FLOAT_EQ(dets[1].box.y2, 60.f);
}

TEST(DecodeYolo, PreboxedRowsAreMappedBackThroughLetterbox) {
  std::vector<float> values(8 * 6, 0.f);
  // x1, y1, x2, y2, score, class
  const float row[6] = {10.f, 26.f, 30.f, 46.f, 0.7f, 3.f};
  std::copy(std::begin(row), std::end(row), values.begin());
  ic::Tensor out({1, 8, 6}, values);
  ib::LetterboxMeta meta = identity_meta(200, 100);
  meta.scale = 0.5f;
  meta.pad_y = 16.f;

  auto dets = ib::decode_yolo_output(out, meta, {});
  ASSERT_EQ(dets.size(), 1u);
  EXPECT_EQ(dets[0].class_id, 3);
  EXPECT_FLOAT_EQ(dets[0].box.x1, 20.f);
  EXPECT_FLOAT_EQ(dets[0].box.y1, 20.f);
  EXPECT_FLOAT_EQ(dets[0].box.x2, 60.f);
  EXPECT_FLOAT_EQ(dets[0].box.y2, 60.f);
}

TEST(DecodeYolo, NanScoresAreDropped) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  std::vector<float> values(8 * 6, 0.f);
  const float rows[2][6] = {{0.f, 0.f, 10.f, 10.f, nan, 0.f}, {50.f, 50.f, 60.f, 60.f, 0.7f, 0.f}};
  std::copy(std::begin(rows[0]), std::end(rows[0]), values.begin());
  std::copy(std::begin(rows[1]), std::end(rows[1]), values.begin() + 6);
  ic::Tensor out({1, 8, 6}, values);

  auto dets = ib::decode_yolo_output(out, identity_meta(100, 100), {});
  ASSERT_EQ(dets.size(), 1u);
  EXPECT_FLOAT_EQ(dets[0].confidence, 0.7f);
}

TEST(DecodeYolo, BoxesAreClampedToImage) {
  ic::Tensor out({1, 1, 5}, {5.f, 5.f, 40.f, 40.f, 0.9f});
  auto dets = ib::decode_yolo_output(out, identity_meta(20, 20), {});
  ASSERT_EQ(dets.size(), 1u);
  EXPECT_FLOAT_EQ(dets[0].box.x1, 0.f);
  EXPECT_FLOAT_EQ(dets[0].box.x2, 20.f);
}

TEST(DecodeYolo, RejectsUnexpectedRank) {
  ic::Tensor out({6, 3}, std::vector<float>(18, 0.f));
  EXPECT_THROW((void)ib::decode_yolo_output(out, identity_meta(10, 10), {}),
               std::invalid_argument);
}

TEST(BoxIou, OverlapAndDisjoint) {
  const ic::BBox a{0.f, 0.f, 10.f, 10.f};
  const ic::BBox b{5.f, 0.f, 15.f, 10.f};
  const ic::BBox c{20.f, 20.f, 30.f, 30.f};
  EXPECT_NEAR(ib::box_iou(a, b), 50.f / 150.f, 1e-6f);
  EXPECT_FLOAT_EQ(ib::box_iou(a, c), 0.f);
  EXPECT_FLOAT_EQ(ib::box_iou(a, a), 1.f);
}

TEST(NonMaxSuppression, SuppressesOverlapsWithinClassOnly) {
  std::vector<ic::Detection> dets{
      {{0.f, 0.f, 10.f, 10.f}, 0.6f, 0, std::nullopt},
      {{1.f, 1.f, 11.f, 11.f}, 0.9f, 0, std::nullopt},
      {{1.f, 1.f, 11.f, 11.f}, 0.5f, 1, std::nullopt},
  };
  auto kept = ib::non_max_suppression(dets, 0.45f);
  ASSERT_EQ(kept.size(), 2u);
  EXPECT_FLOAT_EQ(kept[0].confidence, 0.9f);
  EXPECT_EQ(kept[1].class_id, 1);
}

TEST(NonMaxSuppression, NanConfidenceSortsLast) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  std::vector<ic::Detection> dets{
      {{0.f, 0.f, 10.f, 10.f}, nan, 0, std::nullopt},
      {{0.f, 0.f, 10.f, 10.f}, 0.9f, 0, std::nullopt},
      {{40.f, 40.f, 50.f, 50.f}, nan, 0, std::nullopt},
      {{40.f, 40.f, 50.f, 50.f}, 0.3f, 0, std::nullopt},
  };
  auto kept = ib::non_max_suppression(dets, 0.45f);
  ASSERT_EQ(kept.size(), 2u);
  EXPECT_FLOAT_EQ(kept[0].confidence, 0.9f);
  EXPECT_FLOAT_EQ(kept[1].confidence, 0.3f);
}
