#include <infergate/core/tensor.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace infergate::core {

namespace {

void check_shape(const std::vector<std::int64_t>& shape, std::size_t count) {
  for (const auto d : shape) {
    if (d < 0) {
      throw std::invalid_argument("Tensor: negative dimension in shape " +
                                  shape_to_string(shape));
    }
  }
  if (Tensor::element_count(shape) != count) {
    throw std::invalid_argument("Tensor: shape " + shape_to_string(shape) + " does not hold " +
                                std::to_string(count) + " values");
  }
}

}  // namespace

Tensor::Tensor(std::vector<std::int64_t> shape, std::vector<float> values)
    : shape_(std::move(shape)), values_(std::move(values)) {
  check_shape(shape_, values_.size());
}

Tensor Tensor::reshaped(std::vector<std::int64_t> shape) const& {
  return Tensor(std::move(shape), values_);
}

Tensor Tensor::reshaped(std::vector<std::int64_t> shape) && {
  return Tensor(std::move(shape), std::move(values_));
}

std::size_t Tensor::element_count(std::span<const std::int64_t> shape) noexcept {
  std::size_t n = 1;
  for (const auto d : shape) {
    if (d < 0) return 0;
    n *= static_cast<std::size_t>(d);
  }
  return n;
}

std::string shape_to_string(std::span<const std::int64_t> shape) {
  std::ostringstream out;
  out << '(';
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) out << ", ";
    if (shape[i] < 0) {
      out << '?';
    } else {
      out << shape[i];
    }
  }
  out << ')';
  return out.str();
}

}  // namespace infergate::core
