#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace segeval::core {

/// Memory: Tensor owns a single contiguous float buffer in CHW order
/// (channel planes contiguous, rows within a plane contiguous).
/// Distinct Tensor instances are independent; sharing one across threads
/// for reading is safe.

/// Element type the tensor was decoded from (or is to be written as).
enum class DType : std::uint8_t {
  Float32,
  Float64,
  UInt8,
  Bool,
  Int64,
};

/// Extents of a (channels, height, width) tensor.
struct Shape {
  std::uint32_t channels{0};
  std::uint32_t height{0};
  std::uint32_t width{0};

  [[nodiscard]] std::size_t plane_size() const noexcept {
    return static_cast<std::size_t>(height) * width;
  }
  [[nodiscard]] std::size_t element_count() const noexcept {
    return plane_size() * channels;
  }

  friend bool operator==(const Shape&, const Shape&) = default;
};

/// Dense channels x height x width array of float values.
class Tensor {
 public:
  Tensor() = default;

  /// Zero-filled tensor of the given shape.
  explicit Tensor(Shape shape, DType source_dtype = DType::Float32);

  /// Takes ownership of values; values.size() must equal shape.element_count()
  /// (throws std::invalid_argument otherwise).
  Tensor(Shape shape, std::vector<float> values,
         DType source_dtype = DType::Float32);

  [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
  [[nodiscard]] std::uint32_t channels() const noexcept { return shape_.channels; }
  [[nodiscard]] std::uint32_t height() const noexcept { return shape_.height; }
  [[nodiscard]] std::uint32_t width() const noexcept { return shape_.width; }
  [[nodiscard]] DType source_dtype() const noexcept { return source_dtype_; }

  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

  [[nodiscard]] std::span<float> data() noexcept { return values_; }
  [[nodiscard]] std::span<const float> data() const noexcept { return values_; }

  /// View of one channel plane (height * width values). Throws std::out_of_range.
  [[nodiscard]] std::span<float> channel(std::uint32_t c);
  [[nodiscard]] std::span<const float> channel(std::uint32_t c) const;

  [[nodiscard]] float at(std::uint32_t c, std::uint32_t row, std::uint32_t col) const;
  void set(std::uint32_t c, std::uint32_t row, std::uint32_t col, float value);

  /// True if spatial extents (height, width) agree; channel counts may differ.
  [[nodiscard]] bool same_spatial_extent(const Tensor& other) const noexcept {
    return shape_.height == other.shape_.height && shape_.width == other.shape_.width;
  }

 private:
  [[nodiscard]] std::size_t offset(std::uint32_t c, std::uint32_t row,
                                   std::uint32_t col) const;

  Shape shape_{};
  DType source_dtype_{DType::Float32};
  std::vector<float> values_;
};

}  // namespace segeval::core
