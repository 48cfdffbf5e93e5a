#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <infergate/backend/load_options.hpp>
#include <infergate/core/backend_kind.hpp>
#include <infergate/core/error.hpp>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace infergate::backend {

/// Best-effort guess from the file-name extension; GraphModel when unrecognised.
/// Not a content sniff: wrong guesses surface at load time.
[[nodiscard]] core::BackendKind detect_backend(const std::filesystem::path& path);

/// Kind for a recognised extension, nullopt otherwise.
[[nodiscard]] std::optional<core::BackendKind> backend_for_extension(
    const std::filesystem::path& path);

/// Constructs a handle for one backend kind; throws on failure.
using BackendLoader = std::function<std::unique_ptr<IBackendHandle>(
    const std::filesystem::path& path, const LoadOptions& options)>;

/// Explicit capability check ("is this artifact of that kind?"). Must not throw.
using BackendProbe = std::function<bool(const std::filesystem::path& path)>;

/// Maps backend kinds to constructors and resolves the candidate chain for an artifact.
///
/// Candidate chains:
/// - DynamicModel: DetectionModel first when its probe accepts the artifact, then DynamicModel.
/// - GraphModel / PortableGraph with a recognised extension: that kind only.
/// - Unrecognised extension: GraphModel, PortableGraph, DynamicModel.
/// Kinds without a registered loader (engine not built in) are skipped.
class BackendRegistry {
 public:
  explicit BackendRegistry(LoadOptions options = {});

  void register_loader(core::BackendKind kind, BackendLoader loader);
  void register_probe(core::BackendKind kind, BackendProbe probe);

  [[nodiscard]] bool has_loader(core::BackendKind kind) const;
  [[nodiscard]] const LoadOptions& options() const noexcept { return options_; }

  [[nodiscard]] std::vector<core::BackendKind> candidates(
      const std::filesystem::path& path) const;

  /// Walk the candidate chain. All candidates failing yields LoadFailure for a
  /// recognised extension and UnsupportedBackend otherwise; an empty chain
  /// yields UnsupportedBackend.
  [[nodiscard]] std::expected<std::unique_ptr<IBackendHandle>, core::Error> load(
      const std::filesystem::path& path) const;

 private:
  LoadOptions options_;
  std::map<core::BackendKind, BackendLoader> loaders_;
  std::map<core::BackendKind, BackendProbe> probes_;
};

/// Registry holding every engine compiled into this build.
[[nodiscard]] std::shared_ptr<BackendRegistry> make_default_registry(LoadOptions options = {});

}  // namespace infergate::backend
