#include <infergate/backend/mock_backend_handle.hpp>
#include <infergate/backend/model_cache.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ib = infergate::backend;
namespace ic = infergate::core;
namespace fs = std::filesystem;

namespace {

class ModelCacheTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("infergate_cache_test_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path touch(const std::string& name) {
    const fs::path p = dir_ / name;
    std::ofstream(p) << "model";
    return p;
  }

  /// Registry whose ONNX loader counts constructions and optionally sleeps.
  std::shared_ptr<ib::BackendRegistry> counting_registry(std::chrono::milliseconds delay = {}) {
    auto registry = std::make_shared<ib::BackendRegistry>();
    registry->register_loader(ic::BackendKind::PortableGraph,
                              [this, delay](const fs::path&, const ib::LoadOptions&) {
                                ++constructed_;
                                if (delay.count() > 0) std::this_thread::sleep_for(delay);
                                return std::make_unique<ib::MockBackendHandle>();
                              });
    return registry;
  }

  fs::path dir_;
  std::atomic<int> constructed_{0};
};

}  // namespace

TEST_F(ModelCacheTest, MissingPathIsNotFound) {
  ib::ModelCache cache(counting_registry());
  auto result = cache.get_or_load("k", dir_ / "missing.onnx");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ic::ErrorCode::NotFound);
  EXPECT_EQ(cache.load_count(), 0u);
  EXPECT_EQ(constructed_.load(), 0);
}

TEST_F(ModelCacheTest, MissingPathIsNotFoundEvenForCachedKey) {
  ib::ModelCache cache(counting_registry());
  ASSERT_TRUE(cache.get_or_load("k", touch("a.onnx")).has_value());
  auto result = cache.get_or_load("k", dir_ / "missing.onnx");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ic::ErrorCode::NotFound);
}

TEST_F(ModelCacheTest, SecondCallReturnsSameHandleEvenForDifferentPath) {
  ib::ModelCache cache(counting_registry());
  auto first = cache.get_or_load("k", touch("a.onnx"));
  auto second = cache.get_or_load("k", touch("b.onnx"));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->get(), second->get());
  EXPECT_EQ(constructed_.load(), 1);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_TRUE(cache.contains("k"));
}

TEST_F(ModelCacheTest, DistinctKeysLoadSeparately) {
  ib::ModelCache cache(counting_registry());
  const fs::path p = touch("a.onnx");
  auto a = cache.get_or_load("a", p);
  auto b = cache.get_or_load("b", p);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(a->get(), b->get());
  EXPECT_EQ(cache.size(), 2u);
}

TEST_F(ModelCacheTest, ConcurrentFirstLoadsShareOneLoad) {
  ib::ModelCache cache(counting_registry(std::chrono::milliseconds(50)));
  const fs::path p = touch("a.onnx");

  constexpr int kThreads = 16;
  std::vector<const ib::IBackendHandle*> seen(kThreads, nullptr);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&cache, &seen, &p, i] {
      auto handle = cache.get_or_load("shared", p);
      if (handle) seen[static_cast<std::size_t>(i)] = handle->get();
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(constructed_.load(), 1);
  EXPECT_EQ(cache.load_count(), 1u);
  ASSERT_NE(seen[0], nullptr);
  for (const auto* h : seen) EXPECT_EQ(h, seen[0]);
}

TEST_F(ModelCacheTest, FailedLoadIsNotCachedAndRetries) {
  auto registry = std::make_shared<ib::BackendRegistry>();
  int attempts = 0;
  registry->register_loader(ic::BackendKind::PortableGraph,
                            [&attempts](const fs::path&, const ib::LoadOptions&)
                                -> std::unique_ptr<ib::IBackendHandle> {
                              if (++attempts == 1) throw ib::LoadError("corrupt");
                              return std::make_unique<ib::MockBackendHandle>();
                            });
  ib::ModelCache cache(registry);
  const fs::path p = touch("a.onnx");

  auto first = cache.get_or_load("k", p);
  ASSERT_FALSE(first.has_value());
  EXPECT_EQ(first.error().code, ic::ErrorCode::LoadFailure);
  EXPECT_FALSE(cache.contains("k"));

  auto second = cache.get_or_load("k", p);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(attempts, 2);
  EXPECT_EQ(cache.load_count(), 2u);
}
