#include <infergate/backend/backend_registry.hpp>
#include <infergate/backend/onnx_backend_handle.hpp>
#ifdef INFERGATE_HAS_TENSORFLOW
#include <infergate/backend/tensorflow_backend_handle.hpp>
#endif
#ifdef INFERGATE_HAS_TORCH
#include <infergate/backend/detection_backend_handle.hpp>
#include <infergate/backend/torch_backend_handle.hpp>
#endif
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

namespace infergate::backend {

namespace {

std::string lower_extension(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

}  // namespace

std::optional<core::BackendKind> backend_for_extension(const std::filesystem::path& path) {
  const std::string ext = lower_extension(path);
  if (ext == ".pb" || ext == ".h5" || ext == ".keras") return core::BackendKind::GraphModel;
  if (ext == ".pt" || ext == ".pth" || ext == ".torchscript") return core::BackendKind::DynamicModel;
  if (ext == ".onnx") return core::BackendKind::PortableGraph;
  return std::nullopt;
}

core::BackendKind detect_backend(const std::filesystem::path& path) {
  return backend_for_extension(path).value_or(core::BackendKind::GraphModel);
}

BackendRegistry::BackendRegistry(LoadOptions options) : options_(std::move(options)) {}

void BackendRegistry::register_loader(core::BackendKind kind, BackendLoader loader) {
  if (loader) {
    loaders_[kind] = std::move(loader);
  }
}

void BackendRegistry::register_probe(core::BackendKind kind, BackendProbe probe) {
  if (probe) {
    probes_[kind] = std::move(probe);
  }
}

bool BackendRegistry::has_loader(core::BackendKind kind) const {
  return loaders_.contains(kind);
}

std::vector<core::BackendKind> BackendRegistry::candidates(
    const std::filesystem::path& path) const {
  using core::BackendKind;

  std::vector<BackendKind> chain;
  const auto recognised = backend_for_extension(path);
  if (!recognised) {
    chain = {BackendKind::GraphModel, BackendKind::PortableGraph, BackendKind::DynamicModel};
  } else if (*recognised == BackendKind::DynamicModel) {
    const auto probe = probes_.find(BackendKind::DetectionModel);
    if (probe != probes_.end() && probe->second(path)) {
      chain.push_back(BackendKind::DetectionModel);
    }
    chain.push_back(BackendKind::DynamicModel);
  } else {
    chain.push_back(*recognised);
  }

  std::erase_if(chain, [this](BackendKind k) { return !has_loader(k); });
  return chain;
}

std::expected<std::unique_ptr<IBackendHandle>, core::Error> BackendRegistry::load(
    const std::filesystem::path& path) const {
  const auto recognised = backend_for_extension(path);
  const auto chain = candidates(path);
  if (chain.empty()) {
    return std::unexpected(core::make_error(
        core::ErrorCode::UnsupportedBackend,
        "no backend built into this process can load " + path.string() + " (guessed " +
            std::string(core::framework_tag(detect_backend(path))) + ")"));
  }

  std::string failures;
  for (const auto kind : chain) {
    spdlog::debug("Trying {} backend for {}", core::framework_tag(kind), path.string());
    try {
      auto handle = loaders_.at(kind)(path, options_);
      if (handle) {
        return handle;
      }
      failures += std::string(core::framework_tag(kind)) + ": loader returned no handle; ";
    } catch (const std::exception& e) {
      spdlog::warn("{} backend could not load {}: {}", core::framework_tag(kind),
                   path.string(), e.what());
      failures += std::string(core::framework_tag(kind)) + ": " + e.what() + "; ";
    }
  }
  if (failures.size() >= 2) {
    failures.resize(failures.size() - 2);
  }

  const auto code = recognised ? core::ErrorCode::LoadFailure
                               : core::ErrorCode::UnsupportedBackend;
  return std::unexpected(core::make_error(
      code, "failed to load " + path.string() + " (" + failures + ")"));
}

std::shared_ptr<BackendRegistry> make_default_registry(LoadOptions options) {
  auto registry = std::make_shared<BackendRegistry>(std::move(options));

  registry->register_loader(
      core::BackendKind::PortableGraph,
      [](const std::filesystem::path& path, const LoadOptions& opts) {
        return std::make_unique<OnnxBackendHandle>(path, opts.onnx_intra_op_threads);
      });

#ifdef INFERGATE_HAS_TENSORFLOW
  registry->register_loader(
      core::BackendKind::GraphModel,
      [](const std::filesystem::path& path, const LoadOptions&) {
        return std::make_unique<TensorFlowBackendHandle>(path);
      });
#endif

#ifdef INFERGATE_HAS_TORCH
  registry->register_loader(
      core::BackendKind::DynamicModel,
      [](const std::filesystem::path& path, const LoadOptions& opts) {
        return std::make_unique<TorchBackendHandle>(path, opts.torch_use_cuda);
      });
  registry->register_loader(
      core::BackendKind::DetectionModel,
      [](const std::filesystem::path& path, const LoadOptions& opts) {
        return std::make_unique<DetectionBackendHandle>(path, opts);
      });
  registry->register_probe(core::BackendKind::DetectionModel,
                           [](const std::filesystem::path& path) {
                             return DetectionBackendHandle::is_detection_artifact(path);
                           });
#endif

  return registry;
}

}  // namespace infergate::backend
