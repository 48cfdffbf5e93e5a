#include <infergate/backend/detection_backend_handle.hpp>
#include <infergate/backend/yolo_processing.hpp>
#include <infergate/vision/annotate.hpp>
#include <infergate/vision/image_codec.hpp>
#include "backend/torch_support.hpp"
#include <spdlog/spdlog.h>
#include <torch/script.h>
#include <exception>
#include <string>

namespace infergate::backend {

namespace {

std::optional<DetectionModelInfo> read_detection_info(const detail::TorchArchiveInfo& archive) {
  if (!archive.has_code || !archive.extra_config) return std::nullopt;
  auto info = parse_detection_config(*archive.extra_config);
  if (!info || !info->is_detector()) return std::nullopt;
  return info;
}

}  // namespace

struct DetectionBackendHandle::Impl {
  mutable torch::jit::Module module;
  torch::Device device{torch::kCPU};
  DetectionModelInfo info;
  DetectionParams params;
  std::int64_t input_h{640};
  std::int64_t input_w{640};
  vision::ImageEncoding encoding{vision::ImageEncoding::Png};
};

bool DetectionBackendHandle::is_detection_artifact(const std::filesystem::path& path) noexcept {
  try {
    return read_detection_info(detail::inspect_torch_archive(path)).has_value();
  } catch (const std::exception& e) {
    spdlog::debug("{} is not a detection artifact: {}", path.string(), e.what());
    return false;
  }
}

DetectionBackendHandle::DetectionBackendHandle(const std::filesystem::path& model_path,
                                               const LoadOptions& options)
    : impl_(std::make_unique<Impl>()) {
  const auto archive = detail::inspect_torch_archive(model_path);
  detail::require_full_model(archive);
  auto info = read_detection_info(archive);
  if (!info) {
    throw LoadError("TorchScript archive declares no detection task");
  }
  impl_->info = std::move(*info);
  impl_->params.confidence_threshold = options.detection_confidence_threshold;
  impl_->params.iou_threshold = options.detection_iou_threshold;
  impl_->encoding = options.annotated_encoding;
  impl_->input_h = impl_->info.input_height > 0 ? impl_->info.input_height
                                                : options.detection_input_size;
  impl_->input_w = impl_->info.input_width > 0 ? impl_->info.input_width
                                               : options.detection_input_size;

  impl_->device = detail::select_device(options.torch_use_cuda);
  impl_->module = torch::jit::load(model_path.string(), impl_->device);
  impl_->module.eval();
  spdlog::debug("Detection model: {} classes, input {}x{}", impl_->info.class_names.size(),
                impl_->input_h, impl_->input_w);
}

DetectionBackendHandle::~DetectionBackendHandle() = default;

std::optional<std::vector<std::int64_t>> DetectionBackendHandle::shape() const {
  return std::vector<std::int64_t>{1, 3, impl_->input_h, impl_->input_w};
}

const std::vector<std::string>& DetectionBackendHandle::class_names() const noexcept {
  return impl_->info.class_names;
}

std::expected<core::InferenceResult, core::Error> DetectionBackendHandle::infer(
    const ModelInput& input, const InferOptions& options) const {
  const auto fail = [](std::string message) {
    return std::unexpected(core::make_error(core::ErrorCode::InferenceFailure, std::move(message)));
  };

  const auto* image = std::get_if<core::Image>(&input);
  const auto* tensor = std::get_if<core::Tensor>(&input);
  if (!image && !tensor) return fail("detection backend takes an image or an image tensor");
  if (!image && options.render_annotated) {
    return fail("annotated output requires an image input");
  }

  try {
    LetterboxMeta meta;
    core::Tensor model_input;
    if (image) {
      model_input = letterbox_to_tensor(*image, impl_->input_h, impl_->input_w, meta);
    } else {
      if (tensor->rank() != 4 || tensor->dim(1) != 3) {
        return fail("detection tensor input must be (1, 3, H, W), got " +
                    core::shape_to_string(tensor->shape()));
      }
      meta.original_height = static_cast<std::uint32_t>(tensor->dim(2));
      meta.original_width = static_cast<std::uint32_t>(tensor->dim(3));
      model_input = *tensor;
    }

    const core::Tensor raw = detail::to_core(detail::forward_first_tensor(
        impl_->module, detail::to_torch(model_input, impl_->device)));

    core::DetectionResult result;
    result.detections =
        decode_yolo_output(raw, meta, impl_->params, impl_->info.class_names.size());
    for (auto& det : result.detections) {
      if (det.class_id >= 0 &&
          static_cast<std::size_t>(det.class_id) < impl_->info.class_names.size()) {
        det.class_name = impl_->info.class_names[static_cast<std::size_t>(det.class_id)];
      }
    }

    if (options.render_annotated) {
      const core::Image annotated = vision::render_detections(*image, result.detections);
      auto encoded = vision::encode_image(annotated, impl_->encoding);
      if (!encoded) return fail("failed to encode annotated image");
      result.annotated = std::move(*encoded);
    }
    return result;
  } catch (const c10::Error& e) {
    return fail(std::string("LibTorch: ") + e.what_without_backtrace());
  } catch (const std::exception& e) {
    return fail(e.what());
  }
}

}  // namespace infergate::backend
