#include <segeval/core/metric_record.hpp>
#include <segeval/core/sample.hpp>

namespace segeval::core {

std::string_view to_string(Split split) noexcept {
  switch (split) {
    case Split::Train:
      return "train";
    case Split::Test:
      return "test";
    default:
      return "unknown";
  }
}

std::string_view to_string(ArtifactTag tag) noexcept {
  switch (tag) {
    case ArtifactTag::X:
      return "x";
    case ArtifactTag::Y:
      return "y";
    case ArtifactTag::YHat:
      return "y_hat";
    default:
      return "unknown";
  }
}

std::string_view to_string(MetricKind kind) noexcept {
  switch (kind) {
    case MetricKind::Precision:
      return "precision";
    case MetricKind::Recall:
      return "recall";
    default:
      return "unknown";
  }
}

std::optional<Split> parse_split(std::string_view name) noexcept {
  if (name == "train") return Split::Train;
  if (name == "test") return Split::Test;
  return std::nullopt;
}

const std::filesystem::path& SampleTriple::path(ArtifactTag tag) const noexcept {
  switch (tag) {
    case ArtifactTag::X:
      return x;
    case ArtifactTag::Y:
      return y;
    case ArtifactTag::YHat:
    default:
      return y_hat;
  }
}

}  // namespace segeval::core
