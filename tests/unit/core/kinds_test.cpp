#include <infergate/core/backend_kind.hpp>
#include <infergate/core/error.hpp>
#include <infergate/core/predict_request.hpp>
#include <gtest/gtest.h>

namespace ic = infergate::core;

TEST(BackendKind, FrameworkTagsRoundTrip) {
  for (const auto kind : {ic::BackendKind::GraphModel, ic::BackendKind::DynamicModel,
                          ic::BackendKind::DetectionModel, ic::BackendKind::PortableGraph}) {
    const auto back = ic::backend_kind_from_tag(ic::framework_tag(kind));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, kind);
  }
  EXPECT_EQ(ic::framework_tag(ic::BackendKind::DetectionModel), "yolo");
  EXPECT_FALSE(ic::backend_kind_from_tag("caffe").has_value());
}

TEST(PredictRequest, KindNames) {
  EXPECT_EQ(ic::parse_input_kind("multi_text"), ic::InputKind::MultiText);
  EXPECT_EQ(ic::parse_output_kind("json"), ic::OutputKind::Json);
  EXPECT_EQ(ic::input_kind_name(ic::InputKind::Csv), "csv");
  EXPECT_EQ(ic::output_kind_name(ic::OutputKind::Regression), "regression");
  EXPECT_FALSE(ic::parse_input_kind("audio").has_value());
  EXPECT_FALSE(ic::parse_output_kind("").has_value());
}

TEST(PredictRequest, Defaults) {
  ic::PredictRequest r;
  EXPECT_EQ(r.input_type, ic::InputKind::Numeric);
  EXPECT_EQ(r.output_type, ic::OutputKind::Classification);
  EXPECT_FALSE(r.inputs.has_value());
}

TEST(Error, CodeNames) {
  EXPECT_EQ(ic::error_code_name(ic::ErrorCode::NotFound), "NotFound");
  EXPECT_EQ(ic::error_code_name(ic::ErrorCode::LoadFailure), "LoadFailure");
}
