#include <segeval/core/tensor.hpp>
#include <stdexcept>
#include <string>

namespace segeval::core {

Tensor::Tensor(Shape shape, DType source_dtype)
    : shape_(shape),
      source_dtype_(source_dtype),
      values_(shape.element_count(), 0.f) {}

Tensor::Tensor(Shape shape, std::vector<float> values, DType source_dtype)
    : shape_(shape), source_dtype_(source_dtype), values_(std::move(values)) {
  if (values_.size() != shape_.element_count()) {
    throw std::invalid_argument("Tensor: " + std::to_string(values_.size()) +
                                " values for shape of " +
                                std::to_string(shape_.element_count()));
  }
}

std::span<float> Tensor::channel(std::uint32_t c) {
  if (c >= shape_.channels) throw std::out_of_range("Tensor::channel");
  return data().subspan(static_cast<std::size_t>(c) * shape_.plane_size(),
                        shape_.plane_size());
}

std::span<const float> Tensor::channel(std::uint32_t c) const {
  if (c >= shape_.channels) throw std::out_of_range("Tensor::channel");
  return data().subspan(static_cast<std::size_t>(c) * shape_.plane_size(),
                        shape_.plane_size());
}

float Tensor::at(std::uint32_t c, std::uint32_t row, std::uint32_t col) const {
  return values_[offset(c, row, col)];
}

void Tensor::set(std::uint32_t c, std::uint32_t row, std::uint32_t col, float value) {
  values_[offset(c, row, col)] = value;
}

std::size_t Tensor::offset(std::uint32_t c, std::uint32_t row,
                           std::uint32_t col) const {
  if (c >= shape_.channels || row >= shape_.height || col >= shape_.width) {
    throw std::out_of_range("Tensor index out of range");
  }
  return static_cast<std::size_t>(c) * shape_.plane_size() +
         static_cast<std::size_t>(row) * shape_.width + col;
}

}  // namespace segeval::core
