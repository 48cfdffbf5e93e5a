// End-to-end: JSON text -> request parsing -> default registry -> ONNX Runtime -> JSON body.
// The model-backed case needs INFERGATE_TEST_ONNX_MODEL (any ONNX model with a single
// float input); the others run everywhere.
#include <infergate/app/config.hpp>
#include <infergate/app/dispatcher.hpp>
#include <infergate/app/predict_request.hpp>
#include <infergate/backend/backend_registry.hpp>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <cstdint>
#include <string>
#include <vector>

namespace ia = infergate::app;
namespace ib = infergate::backend;
namespace fs = std::filesystem;

namespace {

ia::Dispatcher make_dispatcher() {
  const auto config = ia::default_config();
  return ia::Dispatcher(ib::make_default_registry(ia::to_load_options(config)), config);
}

Json::Value parse(const std::string& text) {
  auto json = ia::parse_json(text);
  return json ? *json : Json::Value();
}

}  // namespace

TEST(EndToEnd, MissingArtifactIs404) {
  auto dispatcher = make_dispatcher();
  const auto response = dispatcher.handle(parse(
      R"({"model_path": "/definitely/not/here.onnx", "model_key": "nope", "inputs": [1, 2, 3]})"));
  EXPECT_EQ(response.status, 404);
  EXPECT_EQ(response.body["detail"].asString(),
            "Model file not found: /definitely/not/here.onnx");
}

TEST(EndToEnd, CorruptArtifactIs500AndNotCached) {
  const fs::path path = fs::temp_directory_path() / "infergate_e2e_corrupt.onnx";
  { std::ofstream(path) << "garbage bytes"; }
  auto dispatcher = make_dispatcher();
  const Json::Value request = parse(R"({"model_path": ")" + path.generic_string() +
                                    R"(", "model_key": "corrupt", "inputs": [1]})");

  EXPECT_EQ(dispatcher.handle(request).status, 500);
  EXPECT_EQ(dispatcher.handle(request).status, 500);
  EXPECT_EQ(dispatcher.cache().size(), 0u);
  EXPECT_EQ(dispatcher.cache().load_count(), 2u);
  fs::remove(path);
}

TEST(EndToEnd, ValidationPrecedesArtifactCheck) {
  auto dispatcher = make_dispatcher();
  const auto response = dispatcher.handle(parse(
      R"({"model_path": "/not/here.onnx", "model_key": "k", "input_type": "csv"})"));
  EXPECT_EQ(response.status, 400);
}

TEST(EndToEnd, RealOnnxModelAnswersRawJson) {
  const char* env = std::getenv("INFERGATE_TEST_ONNX_MODEL");
  if (!env || env[0] == '\0' || !fs::exists(env)) {
    GTEST_SKIP() << "INFERGATE_TEST_ONNX_MODEL not set";
  }
  auto loaded = ib::make_default_registry()->load(env);
  ASSERT_TRUE(loaded.has_value());
  auto shape = (*loaded)->shape().value_or(std::vector<std::int64_t>{1, 1});
  Json::Value values(Json::arrayValue);
  std::size_t count = 1;
  for (std::size_t i = 1; i < shape.size(); ++i) count *= static_cast<std::size_t>(shape[i] > 0 ? shape[i] : 1);
  for (std::size_t i = 0; i < count; ++i) values.append(0.0);

  Json::Value request(Json::objectValue);
  request["model_path"] = env;
  request["model_key"] = "real";
  request["output_type"] = "json";
  request["inputs"] = values;

  auto dispatcher = make_dispatcher();
  const auto response = dispatcher.handle(request);
  ASSERT_EQ(response.status, 200) << response.body.toStyledString();
  EXPECT_EQ(response.body["framework"].asString(), "onnx");
  EXPECT_TRUE(response.body.isMember("prediction"));
  EXPECT_EQ(dispatcher.health()["cached_models"].asUInt(), 1u);
}
