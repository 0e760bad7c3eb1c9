#include <segeval/core/threshold_sweep.hpp>
#include <cmath>

namespace segeval::core {

namespace {

bool in_open_unit_interval(double v) { return std::isfinite(v) && v > 0.0 && v < 1.0; }

}  // namespace

std::expected<ThresholdSweep, EvalError> ThresholdSweep::from_values(
    std::vector<double> values) {
  if (values.empty()) return std::unexpected(EvalError::InvalidConfig);
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (!in_open_unit_interval(values[i])) {
      return std::unexpected(EvalError::InvalidConfig);
    }
    if (i > 0 && !(values[i] > values[i - 1])) {
      return std::unexpected(EvalError::InvalidConfig);
    }
  }
  return ThresholdSweep(std::move(values));
}

std::expected<ThresholdSweep, EvalError> ThresholdSweep::linear(
    double low, double high, std::size_t steps) {
  if (steps == 0 || steps > kMaxSteps || !in_open_unit_interval(low) ||
      !in_open_unit_interval(high)) {
    return std::unexpected(EvalError::InvalidConfig);
  }
  if (steps == 1) return from_values({low});
  if (!(high > low)) return std::unexpected(EvalError::InvalidConfig);

  std::vector<double> values;
  values.reserve(steps);
  const double step = (high - low) / static_cast<double>(steps - 1);
  for (std::size_t i = 0; i < steps; ++i) {
    values.push_back(low + step * static_cast<double>(i));
  }
  // Last value exactly at the upper bound regardless of rounding.
  values.back() = high;
  return from_values(std::move(values));
}

}  // namespace segeval::core
