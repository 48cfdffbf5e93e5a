#include <infergate/backend/model_cache.hpp>
#include <infergate/core/tensor.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <system_error>
#include <utility>

namespace infergate::backend {

ModelCache::ModelCache(std::shared_ptr<const BackendRegistry> registry)
    : registry_(std::move(registry)) {}

ModelCache::LoadOutcome ModelCache::get_or_load(const std::string& key,
                                                const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(core::make_error(core::ErrorCode::NotFound,
                                            "Model file not found: " + path.string()));
  }

  std::shared_future<LoadOutcome> pending;
  std::promise<LoadOutcome> promise;
  {
    std::lock_guard lock(mutex_);
    if (const auto it = loaded_.find(key); it != loaded_.end()) {
      if (it->second.path != path) {
        spdlog::warn("Model key '{}' is pinned to {}; ignoring requested path {}", key,
                     it->second.path.string(), path.string());
      } else {
        spdlog::debug("Model cache hit for '{}'", key);
      }
      return it->second.handle;
    }
    if (const auto it = in_flight_.find(key); it != in_flight_.end()) {
      pending = it->second;
    } else {
      in_flight_.emplace(key, promise.get_future().share());
    }
  }

  if (pending.valid()) {
    spdlog::debug("Waiting for in-flight load of '{}'", key);
    return pending.get();
  }

  LoadOutcome outcome;
  try {
    outcome = load_uncached(key, path);
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      in_flight_.erase(key);
    }
    promise.set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard lock(mutex_);
    if (outcome) {
      loaded_.emplace(key, Entry{*outcome, path});
    }
    in_flight_.erase(key);
  }
  promise.set_value(outcome);
  return outcome;
}

ModelCache::LoadOutcome ModelCache::load_uncached(const std::string& key,
                                                  const std::filesystem::path& path) {
  ++load_count_;
  spdlog::info("Loading model '{}' from {}", key, path.string());

  auto handle = registry_->load(path);
  if (!handle) {
    spdlog::error("Model '{}' failed to load: {}", key, handle.error().message);
    return std::unexpected(std::move(handle.error()));
  }

  HandlePtr shared = std::move(*handle);
  const auto declared = shared->shape();
  spdlog::info("Model '{}' loaded as {} backend, input shape {}", key,
               core::framework_tag(shared->kind()),
               declared ? core::shape_to_string(*declared) : std::string("unknown"));
  return shared;
}

std::size_t ModelCache::size() const {
  std::lock_guard lock(mutex_);
  return loaded_.size();
}

bool ModelCache::contains(const std::string& key) const {
  std::lock_guard lock(mutex_);
  return loaded_.contains(key);
}

}  // namespace infergate::backend
