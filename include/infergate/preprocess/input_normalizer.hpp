#pragma once

#include <infergate/backend/backend_handle.hpp>
#include <infergate/core/error.hpp>
#include <infergate/core/predict_request.hpp>
#include <infergate/core/tensor.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace infergate::preprocess {

/// Image geometry used when the backend declares no input shape.
struct ImageDefaults {
  std::int64_t height{224};
  std::int64_t width{224};
  std::int64_t channels{3};
};

/// Flat or nested numbers to a rectangular tensor. A scalar becomes (1, 1) and
/// a rank-1 sequence (1, N): one example of N features.
/// ValidationError on an empty, ragged or mixed (number and list) structure.
[[nodiscard]] std::expected<core::Tensor, core::Error> normalize_numeric(
    const core::NumberTree& inputs);

/// Same rules as normalize_numeric, for the raw-structured (json) payload.
[[nodiscard]] std::expected<core::Tensor, core::Error> normalize_json(
    const core::NumberTree& data);

/// Comma-separated rows to a (rows, columns) tensor. A first row that does not
/// parse entirely as numbers is a header and is skipped.
/// ValidationError on no data rows, ragged rows, or a non-numeric data cell.
[[nodiscard]] std::expected<core::Tensor, core::Error> normalize_csv(std::string_view csv);

/// Decode an encoded image and build the tensor the backend expects. Height,
/// width and channels come from a rank-4 declared shape (per layout), each
/// falling back to defaults when undeclared. A rank-3 declared shape
/// (batch, H, W) yields a single-channel (1, H, W) tensor. ValidationError if the payload
/// is not base64, InferenceFailure if it is not a decodable image.
[[nodiscard]] std::expected<core::Tensor, core::Error> normalize_image(
    std::string_view image_base64,
    const std::optional<std::vector<std::int64_t>>& declared_shape,
    core::TensorLayout layout,
    const ImageDefaults& defaults = {});

/// Free text as a (1,) string tensor.
[[nodiscard]] core::TextTensor normalize_text(std::string text);

/// Several texts as an (N,) string tensor.
[[nodiscard]] core::TextTensor normalize_texts(std::vector<std::string> texts);

/// Checks that the field required by request.input_type is present and non-empty.
[[nodiscard]] std::expected<void, core::Error> validate_request(
    const core::PredictRequest& request);

/// Build the model input for handle from the request's declared input kind.
///
/// Detection backends receive the decoded image itself for image input. Tensor
/// and string inputs whose rank differs from a declared input rank are reshaped
/// to (batch, declared[1:]...), batch being the input's own leading dimension,
/// when each of its rows holds exactly one declared example; otherwise
/// InferenceFailure (shape mismatch).
[[nodiscard]] std::expected<backend::ModelInput, core::Error> normalize_input(
    const core::PredictRequest& request,
    const backend::IBackendHandle& handle,
    const ImageDefaults& defaults = {});

}  // namespace infergate::preprocess
