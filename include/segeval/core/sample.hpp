#pragma once

#include <segeval/core/tensor.hpp>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace segeval::core {

/// Train/test partition a sample belongs to. Enumeration order is report order.
enum class Split : std::uint8_t {
  Train,
  Test,
};

/// Artifact type embedded in a file name: x (input), y (labels), y_hat (probabilities).
enum class ArtifactTag : std::uint8_t {
  X,
  Y,
  YHat,
};

[[nodiscard]] std::string_view to_string(Split split) noexcept;
[[nodiscard]] std::string_view to_string(ArtifactTag tag) noexcept;

/// Parses "train" / "test". Returns nullopt for anything else.
[[nodiscard]] std::optional<Split> parse_split(std::string_view name) noexcept;

/// Identity of one evaluated sample; ordered by split, then index.
struct SampleKey {
  Split split{Split::Train};
  std::uint64_t index{0};

  friend auto operator<=>(const SampleKey&, const SampleKey&) = default;
};

/// Paths of the three artifacts of one sample. Built once by the indexer.
struct SampleTriple {
  SampleKey key;
  std::filesystem::path x;
  std::filesystem::path y;
  std::filesystem::path y_hat;

  [[nodiscard]] const std::filesystem::path& path(ArtifactTag tag) const noexcept;
};

/// Arrays of one sample; lives for the duration of one metrics call.
struct LoadedSample {
  SampleKey key;
  Tensor x;
  Tensor y;
  Tensor y_hat;
};

}  // namespace segeval::core
