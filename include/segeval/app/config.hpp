#pragma once

#include <segeval/core/error.hpp>
#include <segeval/core/sample.hpp>
#include <segeval/core/threshold_sweep.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace segeval::app {

/// Evaluation configuration: artifact location, output location, sweep bounds.
struct EvalConfig {
  std::string base_dir;
  std::string output_dir{"output"};
  double threshold_low{0.1};
  double threshold_high{0.9};
  std::size_t threshold_steps{9};
  std::string extension{".npy"};
  std::size_t num_workers{0};  // 0 = hardware concurrency, 1 = sequential
  std::vector<core::Split> splits{core::Split::Train, core::Split::Test};
  bool abort_on_incomplete{false};
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys are ignored; malformed values keep the default and are logged.
EvalConfig load_config(const std::string& path);

/// Parses a non-negative decimal count. Throws std::invalid_argument on a sign,
/// trailing characters or an empty value, std::out_of_range on overflow.
std::size_t parse_count(std::string_view value);

/// Default config when no file is provided.
EvalConfig default_config();

/// Checks the config and builds its threshold sweep.
/// InvalidConfig for an empty base_dir, no splits, or invalid sweep bounds.
[[nodiscard]] std::expected<core::ThresholdSweep, core::EvalError> validate_config(
    const EvalConfig& config);

}  // namespace segeval::app
