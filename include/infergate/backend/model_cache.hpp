#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <infergate/backend/backend_registry.hpp>
#include <infergate/core/error.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace infergate::backend {

/// Process-wide, append-only key -> handle table.
///
/// - At most one load per key for the process lifetime once a load succeeds;
///   no eviction, no reload, no hot-swap.
/// - Single-flight: concurrent first requests for a key share one load and all
///   receive the same handle (or the same error).
/// - A failed load is not cached; the next request retries from scratch.
/// - Keys pin by key: a hit ignores a differing path (logged at warn).
/// Thread-safe.
class ModelCache {
 public:
  using HandlePtr = std::shared_ptr<const IBackendHandle>;
  using LoadOutcome = std::expected<HandlePtr, core::Error>;

  explicit ModelCache(std::shared_ptr<const BackendRegistry> registry);

  ModelCache(const ModelCache&) = delete;
  ModelCache& operator=(const ModelCache&) = delete;

  /// NotFound when path does not exist (checked on every call, hit or miss).
  [[nodiscard]] LoadOutcome get_or_load(const std::string& key,
                                        const std::filesystem::path& path);

  /// Distinct keys successfully loaded.
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool contains(const std::string& key) const;

  /// Loads started since construction (successful or not).
  [[nodiscard]] std::size_t load_count() const noexcept { return load_count_.load(); }

 private:
  struct Entry {
    HandlePtr handle;
    std::filesystem::path path;
  };

  LoadOutcome load_uncached(const std::string& key, const std::filesystem::path& path);

  std::shared_ptr<const BackendRegistry> registry_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> loaded_;
  std::unordered_map<std::string, std::shared_future<LoadOutcome>> in_flight_;
  std::atomic<std::size_t> load_count_{0};
};

}  // namespace infergate::backend
