#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace infergate::core {

/// Memory: Tensor owns a contiguous row-major float buffer; move semantics throughout.
/// Thread-safety: distinct Tensor instances are independent; a const Tensor may be
/// read from several threads.

/// Canonical n-dimensional float array exchanged between normalizers and backends.
class Tensor {
 public:
  Tensor() = default;

  /// Throws std::invalid_argument if the element count implied by shape does not
  /// match values.size() or a dimension is negative.
  Tensor(std::vector<std::int64_t> shape, std::vector<float> values);

  [[nodiscard]] const std::vector<std::int64_t>& shape() const noexcept { return shape_; }
  [[nodiscard]] std::size_t rank() const noexcept { return shape_.size(); }
  [[nodiscard]] std::int64_t dim(std::size_t axis) const { return shape_.at(axis); }

  [[nodiscard]] std::span<float> values() noexcept { return values_; }
  [[nodiscard]] std::span<const float> values() const noexcept { return values_; }
  [[nodiscard]] float* data() noexcept { return values_.data(); }
  [[nodiscard]] const float* data() const noexcept { return values_.data(); }

  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

  /// Same buffer under a new shape; throws std::invalid_argument on element-count mismatch.
  [[nodiscard]] Tensor reshaped(std::vector<std::int64_t> shape) const&;
  [[nodiscard]] Tensor reshaped(std::vector<std::int64_t> shape) &&;

  /// Number of elements for a shape; 0 for a negative (unresolved) dimension.
  [[nodiscard]] static std::size_t element_count(std::span<const std::int64_t> shape) noexcept;

 private:
  std::vector<std::int64_t> shape_;
  std::vector<float> values_;
};

/// Array of strings with an explicit shape (free-text inputs, string outputs).
struct TextTensor {
  std::vector<std::int64_t> shape;
  std::vector<std::string> values;
};

/// Render a shape as "(1, 224, 224, 3)"; unresolved dims print as "?".
[[nodiscard]] std::string shape_to_string(std::span<const std::int64_t> shape);

}  // namespace infergate::core
