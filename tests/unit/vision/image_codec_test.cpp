#include <infergate/vision/image_codec.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <vector>

namespace iv = infergate::vision;
namespace ic = infergate::core;

namespace {

ic::Image gradient_bgr(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(ic::Image::min_bytes(w, h, ic::PixelFormat::BGR8));
  for (std::size_t i = 0; i < buf.size(); ++i) buf[i] = static_cast<std::byte>(i % 251);
  return ic::Image(w, h, ic::PixelFormat::BGR8, std::move(buf));
}

}  // namespace

TEST(ImageCodec, ParseEncodingNames) {
  EXPECT_EQ(iv::parse_image_encoding("png"), iv::ImageEncoding::Png);
  EXPECT_EQ(iv::parse_image_encoding("jpeg"), iv::ImageEncoding::Jpeg);
  EXPECT_EQ(iv::parse_image_encoding("jpg"), iv::ImageEncoding::Jpeg);
  EXPECT_FALSE(iv::parse_image_encoding("gif").has_value());
}

TEST(ImageCodec, PngIsLossless) {
  const auto original = gradient_bgr(7, 5);
  auto encoded = iv::encode_image(original, iv::ImageEncoding::Png);
  ASSERT_TRUE(encoded.has_value());
  EXPECT_EQ(encoded->width, 7u);
  EXPECT_EQ(encoded->height, 5u);
  ASSERT_GT(encoded->bytes.size(), 8u);
  EXPECT_EQ(encoded->bytes[1], 'P');

  auto decoded = iv::decode_image(encoded->bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->format(), ic::PixelFormat::BGR8);
  ASSERT_EQ(decoded->size_bytes(), original.size_bytes());
  EXPECT_TRUE(std::equal(decoded->data().begin(), decoded->data().end(), original.data().begin()));
}

TEST(ImageCodec, JpegKeepsDimensions) {
  auto encoded = iv::encode_image(gradient_bgr(16, 8), iv::ImageEncoding::Jpeg);
  ASSERT_TRUE(encoded.has_value());
  EXPECT_EQ(encoded->bytes[0], 0xFF);
  EXPECT_EQ(encoded->bytes[1], 0xD8);
  auto decoded = iv::decode_image(encoded->bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->width(), 16u);
  EXPECT_EQ(decoded->height(), 8u);
}

TEST(ImageCodec, GrayscaleStaysSingleChannel) {
  std::vector<std::byte> buf(12, std::byte{200});
  ic::Image gray(4, 3, ic::PixelFormat::Grayscale8, std::move(buf));
  auto encoded = iv::encode_image(gray, iv::ImageEncoding::Png);
  ASSERT_TRUE(encoded.has_value());
  auto decoded = iv::decode_image(encoded->bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->channels(), 1u);
}

TEST(ImageCodec, RejectsGarbageAndEmpty) {
  const std::vector<std::uint8_t> junk{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
  EXPECT_FALSE(iv::decode_image(junk).has_value());
  EXPECT_FALSE(iv::decode_image({}).has_value());
  EXPECT_FALSE(iv::encode_image(ic::Image{}, iv::ImageEncoding::Png).has_value());
}
