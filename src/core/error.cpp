#include <segeval/core/error.hpp>

namespace segeval::core {

std::string_view to_string(EvalError error) noexcept {
  switch (error) {
    case EvalError::None:
      return "none";
    case EvalError::InvalidLayout:
      return "invalid directory layout";
    case EvalError::IncompleteTriple:
      return "incomplete triple";
    case EvalError::DuplicateArtifact:
      return "duplicate artifact";
    case EvalError::ShapeMismatch:
      return "shape mismatch";
    case EvalError::EmptyArtifact:
      return "empty artifact";
    case EvalError::NonNumericData:
      return "non-numeric data";
    case EvalError::ArtifactLoadFailed:
      return "artifact load failed";
    case EvalError::InvalidConfig:
      return "invalid config";
    case EvalError::WriteFailed:
      return "write failed";
    default:
      return "unknown";
  }
}

}  // namespace segeval::core
