#include "backend/torch_support.hpp"
#include <infergate/backend/backend_handle.hpp>
#include <caffe2/serialize/inline_container.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace infergate::backend::detail {

TorchArchiveInfo inspect_torch_archive(const std::filesystem::path& path) {
  std::unique_ptr<caffe2::serialize::PyTorchStreamReader> reader;
  try {
    reader = std::make_unique<caffe2::serialize::PyTorchStreamReader>(path.string());
  } catch (const c10::Error& e) {
    spdlog::debug("{} is not a zip archive: {}", path.string(), e.what_without_backtrace());
    throw LoadError("not a TorchScript archive (pickled checkpoint?)");
  }

  TorchArchiveInfo info;
  for (const auto& record : reader->getAllRecords()) {
    if (record.starts_with("code/")) info.has_code = true;
    if (record == "data.pkl") info.has_data_pkl = true;
  }
  if (reader->hasRecord("extra/config.txt")) {
    auto [data, size] = reader->getRecord("extra/config.txt");
    info.extra_config.emplace(static_cast<const char*>(data.get()), size);
  }
  return info;
}

void require_full_model(const TorchArchiveInfo& info) {
  if (!info.has_code && info.has_data_pkl) {
    throw LoadError("file contains parameters only, not a full exported model");
  }
  if (!info.has_code) {
    throw LoadError("not a TorchScript archive (pickled checkpoint?)");
  }
}

torch::Device select_device(bool use_cuda) {
  if (use_cuda && torch::cuda::is_available()) {
    return torch::Device(torch::kCUDA, 0);
  }
  return torch::Device(torch::kCPU);
}

torch::Tensor forward_first_tensor(torch::jit::Module& module, torch::Tensor input) {
  torch::NoGradGuard no_grad;
  std::vector<torch::jit::IValue> inputs;
  inputs.emplace_back(std::move(input));

  torch::jit::IValue out = module.forward(inputs);
  while (!out.isTensor()) {
    if (out.isTuple() && !out.toTupleRef().elements().empty()) {
      out = out.toTupleRef().elements()[0];
    } else if (out.isList() && !out.toListRef().empty()) {
      out = out.toListRef()[0];
    } else if (out.isTensorList() && !out.toTensorList().empty()) {
      out = out.toTensorList().get(0);
    } else {
      throw std::runtime_error("TorchScript forward returned " + out.tagKind() +
                               ", not a tensor");
    }
  }
  return out.toTensor();
}

torch::Tensor to_torch(const core::Tensor& tensor, const torch::Device& device) {
  return torch::from_blob(const_cast<float*>(tensor.data()), tensor.shape(),
                          torch::TensorOptions().dtype(torch::kFloat32))
      .clone()
      .to(device);
}

core::Tensor to_core(const torch::Tensor& tensor) {
  const torch::Tensor cpu = tensor.detach().to(torch::kCPU, torch::kFloat32).contiguous();
  std::vector<float> values(static_cast<std::size_t>(cpu.numel()));
  if (!values.empty()) {
    std::memcpy(values.data(), cpu.data_ptr<float>(), values.size() * sizeof(float));
  }
  return core::Tensor(cpu.sizes().vec(), std::move(values));
}

}  // namespace infergate::backend::detail
