#include <infergate/backend/backend_registry.hpp>
#include <infergate/backend/mock_backend_handle.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace ib = infergate::backend;
namespace ic = infergate::core;

namespace {

ib::BackendLoader mock_loader(ic::BackendKind kind) {
  return [kind](const std::filesystem::path&, const ib::LoadOptions&) {
    return std::make_unique<ib::MockBackendHandle>(kind);
  };
}

ib::BackendLoader failing_loader(std::string message) {
  return [message](const std::filesystem::path&, const ib::LoadOptions&)
             -> std::unique_ptr<ib::IBackendHandle> { throw ib::LoadError(message); };
}

}  // namespace

TEST(DetectBackend, ByExtension) {
  EXPECT_EQ(ib::detect_backend("m/model.pb"), ic::BackendKind::GraphModel);
  EXPECT_EQ(ib::detect_backend("m/model.h5"), ic::BackendKind::GraphModel);
  EXPECT_EQ(ib::detect_backend("m/model.keras"), ic::BackendKind::GraphModel);
  EXPECT_EQ(ib::detect_backend("m/model.pt"), ic::BackendKind::DynamicModel);
  EXPECT_EQ(ib::detect_backend("m/model.PTH"), ic::BackendKind::DynamicModel);
  EXPECT_EQ(ib::detect_backend("m/model.torchscript"), ic::BackendKind::DynamicModel);
  EXPECT_EQ(ib::detect_backend("m/model.onnx"), ic::BackendKind::PortableGraph);
}

TEST(DetectBackend, UnknownExtensionDefaultsToGraphModel) {
  EXPECT_EQ(ib::detect_backend("m/saved_model_dir"), ic::BackendKind::GraphModel);
  EXPECT_EQ(ib::detect_backend("m/model.bin"), ic::BackendKind::GraphModel);
  EXPECT_FALSE(ib::backend_for_extension("m/model.bin").has_value());
}

TEST(BackendRegistry, CandidatesSkipKindsWithoutLoader) {
  ib::BackendRegistry registry;
  registry.register_loader(ic::BackendKind::PortableGraph, mock_loader(ic::BackendKind::PortableGraph));

  EXPECT_EQ(registry.candidates("a.onnx"), std::vector<ic::BackendKind>{ic::BackendKind::PortableGraph});
  EXPECT_TRUE(registry.candidates("a.pb").empty());
  EXPECT_EQ(registry.candidates("a.bin"), std::vector<ic::BackendKind>{ic::BackendKind::PortableGraph});
}

TEST(BackendRegistry, UnknownExtensionTriesEveryKindInOrder) {
  ib::BackendRegistry registry;
  for (const auto kind : {ic::BackendKind::GraphModel, ic::BackendKind::DynamicModel,
                          ic::BackendKind::PortableGraph}) {
    registry.register_loader(kind, mock_loader(kind));
  }
  const std::vector<ic::BackendKind> expected{ic::BackendKind::GraphModel,
                                              ic::BackendKind::PortableGraph,
                                              ic::BackendKind::DynamicModel};
  EXPECT_EQ(registry.candidates("model"), expected);
}

TEST(BackendRegistry, DetectionCandidateOnlyWhenProbeAccepts) {
  ib::BackendRegistry registry;
  registry.register_loader(ic::BackendKind::DynamicModel, mock_loader(ic::BackendKind::DynamicModel));
  registry.register_loader(ic::BackendKind::DetectionModel, mock_loader(ic::BackendKind::DetectionModel));
  registry.register_probe(ic::BackendKind::DetectionModel, [](const std::filesystem::path& p) {
    return p.stem().string() == "yolo";
  });

  const std::vector<ic::BackendKind> promoted{ic::BackendKind::DetectionModel,
                                              ic::BackendKind::DynamicModel};
  EXPECT_EQ(registry.candidates("yolo.pt"), promoted);
  EXPECT_EQ(registry.candidates("resnet.pt"),
            std::vector<ic::BackendKind>{ic::BackendKind::DynamicModel});

  auto handle = registry.load("yolo.pt");
  ASSERT_TRUE(handle.has_value());
  EXPECT_EQ((*handle)->kind(), ic::BackendKind::DetectionModel);
}

TEST(BackendRegistry, FallsBackToNextCandidate) {
  ib::BackendRegistry registry;
  registry.register_loader(ic::BackendKind::DetectionModel, failing_loader("no detect head"));
  registry.register_loader(ic::BackendKind::DynamicModel, mock_loader(ic::BackendKind::DynamicModel));
  registry.register_probe(ic::BackendKind::DetectionModel, [](const std::filesystem::path&) { return true; });

  auto handle = registry.load("model.pt");
  ASSERT_TRUE(handle.has_value());
  EXPECT_EQ((*handle)->kind(), ic::BackendKind::DynamicModel);
}

TEST(BackendRegistry, AllCandidatesFailingIsLoadFailureWithDiagnosis) {
  ib::BackendRegistry registry;
  registry.register_loader(ic::BackendKind::DynamicModel,
                           failing_loader("file contains parameters only, not a full exported model"));

  auto handle = registry.load("weights.pth");
  ASSERT_FALSE(handle.has_value());
  EXPECT_EQ(handle.error().code, ic::ErrorCode::LoadFailure);
  EXPECT_NE(handle.error().message.find("parameters only"), std::string::npos);
}

TEST(BackendRegistry, UnknownExtensionFailingIsUnsupportedBackend) {
  ib::BackendRegistry registry;
  registry.register_loader(ic::BackendKind::GraphModel, failing_loader("not a graph"));
  registry.register_loader(ic::BackendKind::PortableGraph, failing_loader("not onnx"));

  auto handle = registry.load("model.bin");
  ASSERT_FALSE(handle.has_value());
  EXPECT_EQ(handle.error().code, ic::ErrorCode::UnsupportedBackend);
}

TEST(BackendRegistry, NoLoaderForKindIsUnsupportedBackend) {
  ib::BackendRegistry registry;
  auto handle = registry.load("model.pt");
  ASSERT_FALSE(handle.has_value());
  EXPECT_EQ(handle.error().code, ic::ErrorCode::UnsupportedBackend);
}

TEST(BackendRegistry, LoaderReceivesOptions) {
  ib::LoadOptions options;
  options.detection_input_size = 320;
  ib::BackendRegistry registry(options);
  std::int64_t seen = 0;
  registry.register_loader(ic::BackendKind::PortableGraph,
                           [&seen](const std::filesystem::path&, const ib::LoadOptions& o) {
                             seen = o.detection_input_size;
                             return std::make_unique<ib::MockBackendHandle>();
                           });
  ASSERT_TRUE(registry.load("m.onnx").has_value());
  EXPECT_EQ(seen, 320);
}

TEST(DefaultRegistry, AlwaysHasPortableGraph) {
  auto registry = ib::make_default_registry();
  ASSERT_NE(registry, nullptr);
  EXPECT_TRUE(registry->has_loader(ic::BackendKind::PortableGraph));
#ifdef INFERGATE_HAS_TORCH
  EXPECT_TRUE(registry->has_loader(ic::BackendKind::DynamicModel));
  EXPECT_TRUE(registry->has_loader(ic::BackendKind::DetectionModel));
#else
  EXPECT_FALSE(registry->has_loader(ic::BackendKind::DynamicModel));
#endif
#ifdef INFERGATE_HAS_TENSORFLOW
  EXPECT_TRUE(registry->has_loader(ic::BackendKind::GraphModel));
#else
  EXPECT_FALSE(registry->has_loader(ic::BackendKind::GraphModel));
#endif
}
