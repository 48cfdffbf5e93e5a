#include <infergate/backend/torch_backend_handle.hpp>
#include "backend/torch_support.hpp"
#include <spdlog/spdlog.h>
#include <torch/script.h>
#include <torch/version.h>
#include <string>

namespace infergate::backend {

struct TorchBackendHandle::Impl {
  mutable torch::jit::Module module;
  torch::Device device{torch::kCPU};
};

TorchBackendHandle::TorchBackendHandle(const std::filesystem::path& model_path, bool use_cuda)
    : impl_(std::make_unique<Impl>()) {
  detail::require_full_model(detail::inspect_torch_archive(model_path));

  impl_->device = detail::select_device(use_cuda);
  impl_->module = torch::jit::load(model_path.string(), impl_->device);
  impl_->module.eval();
  spdlog::debug("TorchScript module loaded on {}", impl_->device.str());
}

TorchBackendHandle::~TorchBackendHandle() = default;

std::expected<core::InferenceResult, core::Error> TorchBackendHandle::infer(
    const ModelInput& input, const InferOptions& /*options*/) const {
  const auto* tensor = std::get_if<core::Tensor>(&input);
  if (!tensor) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            "TorchScript backend takes numeric tensors only"));
  }
  try {
    const torch::Tensor out =
        detail::forward_first_tensor(impl_->module, detail::to_torch(*tensor, impl_->device));
    return detail::to_core(out);
  } catch (const c10::Error& e) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure,
                                            std::string("LibTorch: ") +
                                                e.what_without_backtrace()));
  } catch (const std::exception& e) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure, e.what()));
  }
}

std::string TorchBackendHandle::runtime_version() { return TORCH_VERSION; }

}  // namespace infergate::backend
