#pragma once

#include <segeval/core/sample.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace segeval::core {

/// Precision or recall value; std::nullopt is "undefined" (zero denominator).
/// Undefined is a property of the data, never replaced by 0 or 1.
using MetricValue = std::optional<double>;

enum class MetricKind : std::uint8_t {
  Precision,
  Recall,
};

[[nodiscard]] std::string_view to_string(MetricKind kind) noexcept;

/// Precision/recall of one class channel of one sample at one threshold.
struct MetricRecord {
  Split split{Split::Train};
  std::uint64_t sample_index{0};
  std::uint32_t class_index{0};
  double threshold{0.0};
  MetricValue precision;
  MetricValue recall;

  /// Counts the values were derived from.
  double true_positive{0.0};
  std::uint64_t predicted_positive{0};
  double actual_positive{0.0};

  [[nodiscard]] SampleKey key() const noexcept { return {split, sample_index}; }
  [[nodiscard]] const MetricValue& value(MetricKind kind) const noexcept {
    return kind == MetricKind::Precision ? precision : recall;
  }
};

/// Threshold-averaged precision/recall of one (split, sample, class) group.
/// Undefined values are excluded from both sum and count; a mean is undefined
/// when every value of the group was undefined.
struct AggregateRecord {
  std::uint64_t sample_index{0};
  std::uint32_t class_index{0};
  MetricValue mean_precision;
  MetricValue mean_recall;
  Split split{Split::Train};

  std::uint32_t precision_count{0};
  std::uint32_t recall_count{0};

  [[nodiscard]] SampleKey key() const noexcept { return {split, sample_index}; }
  [[nodiscard]] const MetricValue& mean(MetricKind kind) const noexcept {
    return kind == MetricKind::Precision ? mean_precision : mean_recall;
  }
};

/// One position of the ranking: an aggregate seen through one metric kind.
struct RankEntry {
  MetricKind kind{MetricKind::Precision};
  MetricValue value;
  AggregateRecord record;
};

}  // namespace segeval::core
