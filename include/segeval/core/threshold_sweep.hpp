#pragma once

#include <segeval/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <utility>
#include <vector>

namespace segeval::core {

/// Strictly increasing sequence of probability cutoffs in the open interval (0, 1).
/// Fixed for a given evaluation run.
class ThresholdSweep {
 public:
  /// Upper bound on the number of thresholds in one sweep.
  static constexpr std::size_t kMaxSteps = 100000;

  /// Validates an explicit list. InvalidConfig if empty, not strictly
  /// increasing, or any value outside (0, 1).
  [[nodiscard]] static std::expected<ThresholdSweep, EvalError> from_values(
      std::vector<double> values);

  /// Inclusive linear spacing: steps == 1 -> {low}; otherwise low ... high.
  /// Requires 0 < low < high < 1 (low == high only when steps == 1) and
  /// 1 <= steps <= kMaxSteps.
  [[nodiscard]] static std::expected<ThresholdSweep, EvalError> linear(
      double low, double high, std::size_t steps);

  [[nodiscard]] std::span<const double> values() const noexcept { return values_; }
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
  [[nodiscard]] double operator[](std::size_t i) const { return values_.at(i); }

  [[nodiscard]] auto begin() const noexcept { return values_.begin(); }
  [[nodiscard]] auto end() const noexcept { return values_.end(); }

 private:
  explicit ThresholdSweep(std::vector<double> values) : values_(std::move(values)) {}

  std::vector<double> values_;
};

}  // namespace segeval::core
