#pragma once

#include <segeval/core/error.hpp>
#include <segeval/core/sample.hpp>
#include <segeval/core/tensor.hpp>
#include <segeval/eval/array_loader.hpp>
#include <expected>
#include <filesystem>

namespace segeval::eval {

/// Reads NumPy .npy files (format versions 1.0, 2.0, 3.0).
/// Supported: little-endian <f4, <f8, <i8, |u1, |b1 in C order, rank 2 (H x W,
/// loaded as one channel) or rank 3 (C x H x W). Everything else is rejected
/// with ArtifactLoadFailed and logged with the offending path.
class NpyArrayLoader : public IArrayLoader {
 public:
  [[nodiscard]] std::expected<core::Tensor, core::EvalError> load(
      const std::filesystem::path& path) const override;
};

/// Writes a tensor as a rank-3 (C, H, W) .npy v1.0 file.
/// dtype must be Float32, Float64 or UInt8 (InvalidConfig otherwise);
/// UInt8 values are rounded and clamped to [0, 255].
[[nodiscard]] std::expected<void, core::EvalError> write_npy(
    const std::filesystem::path& path,
    const core::Tensor& tensor,
    core::DType dtype = core::DType::Float32);

/// Persists a realized triple as base_dir/<split>/{x,y,y_hat}<index>.npy,
/// creating directories as needed. Any stage that randomizes its inputs
/// saves them through this so evaluation compares artifacts produced together.
[[nodiscard]] std::expected<void, core::EvalError> write_sample_triple(
    const std::filesystem::path& base_dir,
    const core::SampleKey& key,
    const core::Tensor& x,
    const core::Tensor& y,
    const core::Tensor& y_hat);

}  // namespace segeval::eval
