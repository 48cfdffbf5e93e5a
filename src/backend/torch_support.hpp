#pragma once

#include <infergate/core/tensor.hpp>
#include <torch/script.h>
#include <filesystem>
#include <optional>
#include <string>

namespace infergate::backend::detail {

/// What a TorchScript zip archive carries, read without deserializing the module.
struct TorchArchiveInfo {
  bool has_code{false};
  bool has_data_pkl{false};
  std::optional<std::string> extra_config;  // extra/config.txt contents
};

/// Throws LoadError "not a TorchScript archive (pickled checkpoint?)" when the
/// file is not a zip archive.
TorchArchiveInfo inspect_torch_archive(const std::filesystem::path& path);

/// Throws LoadError when the archive holds parameters only (no code/ records).
void require_full_model(const TorchArchiveInfo& info);

torch::Device select_device(bool use_cuda);

/// forward() under NoGradGuard; tuple/list outputs are unwrapped to their first tensor.
/// Throws c10::Error from the module, std::runtime_error on a non-tensor output.
torch::Tensor forward_first_tensor(torch::jit::Module& module, torch::Tensor input);

/// Wrap a canonical tensor (copied) as a float torch tensor on device.
torch::Tensor to_torch(const core::Tensor& tensor, const torch::Device& device);

/// CPU float copy of a torch tensor.
core::Tensor to_core(const torch::Tensor& tensor);

}  // namespace infergate::backend::detail
