#pragma once

#include <segeval/core/error.hpp>
#include <segeval/core/sample.hpp>
#include <segeval/core/tensor.hpp>
#include <expected>
#include <filesystem>

namespace segeval::eval {

/// Abstract array loader: file path -> Tensor.
/// Implementations must be safe to call concurrently from worker threads.
class IArrayLoader {
 public:
  virtual ~IArrayLoader() = default;

  /// Loads one array. ArtifactLoadFailed on unreadable or malformed input.
  [[nodiscard]] virtual std::expected<core::Tensor, core::EvalError> load(
      const std::filesystem::path& path) const = 0;

  /// Loads x, y and y_hat of a triple. Default: three load() calls, first
  /// failure wins.
  [[nodiscard]] virtual std::expected<core::LoadedSample, core::EvalError>
  load_sample(const core::SampleTriple& triple) const;
};

}  // namespace segeval::eval
