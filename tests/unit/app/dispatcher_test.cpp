#include <infergate/app/batch_runner.hpp>
#include <infergate/app/dispatcher.hpp>
#include <infergate/backend/mock_backend_handle.hpp>
#include <infergate/core/base64.hpp>
#include <infergate/vision/image_codec.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ia = infergate::app;
namespace ib = infergate::backend;
namespace ic = infergate::core;
namespace iv = infergate::vision;
namespace fs = std::filesystem;

namespace {

/// Dispatcher over a registry whose ONNX loader builds mock handles. Files
/// whose stem starts with "broken" yield a handle that fails at inference;
/// "detector" files yield a detection-kind handle.
class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("infergate_dispatcher_test_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    fs::create_directories(dir_);

    auto registry = std::make_shared<ib::BackendRegistry>();
    registry->register_loader(
        ic::BackendKind::PortableGraph, [this](const fs::path& path, const ib::LoadOptions&) {
          ++loads_;
          std::this_thread::sleep_for(std::chrono::milliseconds(20));
          const std::string stem = path.stem().string();
          if (stem.starts_with("detector")) {
            auto mock = std::make_unique<ib::MockBackendHandle>(ic::BackendKind::DetectionModel);
            mock->set_accepts_images(true);
            ic::DetectionResult result;
            result.detections.push_back({{1.f, 1.f, 5.f, 5.f}, 0.75f, 0, std::string("person")});
            mock->set_result(result);
            return mock;
          }
          auto mock = std::make_unique<ib::MockBackendHandle>();
          if (stem.starts_with("broken")) {
            mock->set_error(ic::make_error(ic::ErrorCode::InferenceFailure,
                                           "engine exploded at node 42"));
          }
          return mock;
        });
    dispatcher_ = std::make_unique<ia::Dispatcher>(registry, ia::default_config());
  }

  void TearDown() override {
    dispatcher_.reset();
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string touch(const std::string& name) {
    const fs::path p = dir_ / name;
    std::ofstream(p) << "model";
    return p.string();
  }

  Json::Value request(const std::string& path, const std::string& key) {
    Json::Value r(Json::objectValue);
    r["model_path"] = path;
    r["model_key"] = key;
    return r;
  }

  static Json::Value numbers(std::initializer_list<double> values) {
    Json::Value arr(Json::arrayValue);
    for (double v : values) arr.append(v);
    return arr;
  }

  fs::path dir_;
  std::atomic<int> loads_{0};
  std::unique_ptr<ia::Dispatcher> dispatcher_;
};

std::string png_base64() {
  std::vector<std::byte> buf(ic::Image::min_bytes(8, 8, ic::PixelFormat::BGR8), std::byte{10});
  auto encoded = iv::encode_image(ic::Image(8, 8, ic::PixelFormat::BGR8, std::move(buf)),
                                  iv::ImageEncoding::Png);
  return encoded ? ic::base64_encode(encoded->bytes) : std::string();
}

}  // namespace

TEST_F(DispatcherTest, NumericClassificationSucceedsWithFrameworkTag) {
  auto r = request(touch("clf.onnx"), "clf");
  r["inputs"] = numbers({0.1, 0.7, 0.2});
  const auto response = dispatcher_->handle(r);
  ASSERT_EQ(response.status, 200) << response.body.toStyledString();
  EXPECT_EQ(response.body["predicted_class"].asInt(), 1);
  EXPECT_DOUBLE_EQ(response.body["confidence"].asDouble(), 0.7);
  EXPECT_EQ(response.body["framework"].asString(), "onnx");
}

TEST_F(DispatcherTest, MissingImageFieldIs400WithoutLoading) {
  auto r = request(touch("img.onnx"), "img");
  r["input_type"] = "image";
  const auto response = dispatcher_->handle(r);
  EXPECT_EQ(response.status, 400);
  EXPECT_NE(response.body["detail"].asString().find("image_base64"), std::string::npos);
  EXPECT_EQ(loads_.load(), 0);
  EXPECT_EQ(dispatcher_->cache().load_count(), 0u);
}

TEST_F(DispatcherTest, MissingModelFileIs404) {
  auto r = request((dir_ / "absent.onnx").string(), "absent");
  r["inputs"] = numbers({1.0});
  const auto response = dispatcher_->handle(r);
  EXPECT_EQ(response.status, 404);
  EXPECT_NE(response.body["detail"].asString().find("Model file not found"), std::string::npos);
}

TEST_F(DispatcherTest, InferenceFailureIsOpaque500) {
  auto r = request(touch("broken.onnx"), "broken");
  r["inputs"] = numbers({1.0, 2.0});
  const auto response = dispatcher_->handle(r);
  EXPECT_EQ(response.status, 500);
  EXPECT_EQ(response.body["detail"].asString(), "Prediction failed");
  EXPECT_EQ(response.body.toStyledString().find("node 42"), std::string::npos);
}

TEST_F(DispatcherTest, UnsupportedExtensionWithoutLoaderIs500) {
  auto r = request(touch("model.pb"), "tf");
  r["inputs"] = numbers({1.0});
  const auto response = dispatcher_->handle(r);
  EXPECT_EQ(response.status, 500);
  EXPECT_EQ(response.body["detail"].asString(), "Prediction failed");
}

TEST_F(DispatcherTest, MalformedRequestIs400) {
  Json::Value r(Json::objectValue);
  r["model_key"] = "k";
  EXPECT_EQ(dispatcher_->handle(r).status, 400);
  EXPECT_EQ(dispatcher_->handle(Json::Value("text")).status, 400);
}

TEST_F(DispatcherTest, SecondRequestReusesCachedModel) {
  const std::string path = touch("reg.onnx");
  auto r = request(path, "reg");
  r["output_type"] = "regression";
  r["inputs"] = numbers({4.0});
  ASSERT_EQ(dispatcher_->handle(r).status, 200);
  const auto second = dispatcher_->handle(r);
  ASSERT_EQ(second.status, 200);
  EXPECT_DOUBLE_EQ(second.body["value"].asDouble(), 4.0);
  EXPECT_EQ(loads_.load(), 1);
  EXPECT_EQ(dispatcher_->health()["cached_models"].asUInt(), 1u);
}

TEST_F(DispatcherTest, TextRequestEchoesThroughStringTensor) {
  auto r = request(touch("nlp.onnx"), "nlp");
  r["input_type"] = "text";
  r["output_type"] = "text";
  r["text"] = "hello";
  const auto response = dispatcher_->handle(r);
  ASSERT_EQ(response.status, 200);
  EXPECT_EQ(response.body["prediction"][0].asString(), "hello");
}

TEST_F(DispatcherTest, DetectorGetsRawImageAndAnnotationFlag) {
  auto r = request(touch("detector.onnx"), "det");
  r["input_type"] = "image";
  r["output_type"] = "image";
  r["image_base64"] = png_base64();
  const auto response = dispatcher_->handle(r);
  ASSERT_EQ(response.status, 200) << response.body.toStyledString();
  EXPECT_EQ(response.body["framework"].asString(), "yolo");
  EXPECT_EQ(response.body["count"].asUInt(), 1u);
  EXPECT_EQ(response.body["detections"][0]["class_name"].asString(), "person");
}

TEST_F(DispatcherTest, HealthReportsBackendsAndOpenCv) {
  const auto health = dispatcher_->health();
  EXPECT_EQ(health["status"].asString(), "ok");
  EXPECT_EQ(health["cached_models"].asUInt(), 0u);
  EXPECT_TRUE(health["backends"].isMember("onnx"));
  EXPECT_FALSE(health["opencv_version"].asString().empty());
}

TEST_F(DispatcherTest, BatchKeepsOrderAndLoadsOncePerKey) {
  const std::string path = touch("batch.onnx");
  std::vector<Json::Value> requests;
  for (int i = 0; i < 24; ++i) {
    auto r = request(path, "batch");
    r["output_type"] = "regression";
    r["inputs"] = numbers({static_cast<double>(i)});
    requests.push_back(r);
  }
  requests.push_back(request((dir_ / "missing.onnx").string(), "missing"));
  requests.back()["inputs"] = numbers({1.0});

  const auto responses = ia::run_batch_parallel(*dispatcher_, requests, 4);
  ASSERT_EQ(responses.size(), requests.size());
  for (int i = 0; i < 24; ++i) {
    ASSERT_EQ(responses[static_cast<std::size_t>(i)].status, 200);
    EXPECT_DOUBLE_EQ(responses[static_cast<std::size_t>(i)].body["value"].asDouble(), i);
  }
  EXPECT_EQ(responses.back().status, 404);
  EXPECT_EQ(loads_.load(), 1);
}

TEST_F(DispatcherTest, EmptyBatchIsEmpty) {
  EXPECT_TRUE(ia::run_batch_parallel(*dispatcher_, {}, 0).empty());
}
