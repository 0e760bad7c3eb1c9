#pragma once

#include <string_view>

namespace segeval::core {

/// Evaluation error codes; used with std::expected for recoverable failures.
enum class EvalError {
  None = 0,
  InvalidLayout,       // base directory missing or without split directories
  IncompleteTriple,    // x / y / y_hat not all present for a sample
  DuplicateArtifact,   // two files map to the same (split, index, tag)
  ShapeMismatch,
  EmptyArtifact,
  NonNumericData,      // NaN or infinity in y / y_hat
  ArtifactLoadFailed,
  InvalidConfig,
  WriteFailed,
};

[[nodiscard]] std::string_view to_string(EvalError error) noexcept;

}  // namespace segeval::core
