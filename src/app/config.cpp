#include <segeval/app/config.hpp>
#include <segeval/core/logger.hpp>
#include <charconv>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace segeval::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::invalid_argument("not a boolean: " + value);
}

std::vector<core::Split> parse_splits(const std::string& value) {
  std::vector<core::Split> splits;
  std::string_view rest = value;
  while (!rest.empty()) {
    const auto comma = rest.find(',');
    std::string name(rest.substr(0, comma));
    trim(name);
    if (!name.empty()) {
      auto split = core::parse_split(name);
      if (!split) throw std::invalid_argument("unknown split: " + name);
      splits.push_back(*split);
    }
    if (comma == std::string_view::npos) break;
    rest.remove_prefix(comma + 1);
  }
  return splits;
}

}  // namespace

std::size_t parse_count(std::string_view value) {
  std::size_t out = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec == std::errc::result_out_of_range) {
    throw std::out_of_range("count out of range: " + std::string(value));
  }
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::invalid_argument("not a non-negative count: " + std::string(value));
  }
  return out;
}

EvalConfig default_config() {
  EvalConfig c;
  c.base_dir = "";
  c.output_dir = "output";
  c.threshold_low = 0.1;
  c.threshold_high = 0.9;
  c.threshold_steps = 9;
  c.extension = ".npy";
  c.num_workers = 0;
  return c;
}

EvalConfig load_config(const std::string& path) {
  EvalConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    core::logger().warn("config file {} not readable, using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    try {
      if (key == "base_dir") c.base_dir = value;
      else if (key == "output_dir") c.output_dir = value;
      else if (key == "threshold_low") c.threshold_low = std::stod(value);
      else if (key == "threshold_high") c.threshold_high = std::stod(value);
      else if (key == "threshold_steps") c.threshold_steps = parse_count(value);
      else if (key == "extension") c.extension = value;
      else if (key == "num_workers") c.num_workers = parse_count(value);
      else if (key == "splits") c.splits = parse_splits(value);
      else if (key == "abort_on_incomplete") c.abort_on_incomplete = parse_bool(value);
      else if (key == "log_level") c.log_level = value;
    } catch (const std::exception& e) {
      core::logger().warn("config {}: ignoring {}={} ({})", path, key, value, e.what());
    }
  }
  return c;
}

std::expected<core::ThresholdSweep, core::EvalError> validate_config(const EvalConfig& config) {
  if (config.base_dir.empty()) {
    core::logger().error("base_dir is not set");
    return std::unexpected(core::EvalError::InvalidConfig);
  }
  if (config.splits.empty()) {
    core::logger().error("no splits selected");
    return std::unexpected(core::EvalError::InvalidConfig);
  }
  auto sweep = core::ThresholdSweep::linear(config.threshold_low, config.threshold_high,
                                            config.threshold_steps);
  if (!sweep) {
    core::logger().error("invalid threshold sweep low={} high={} steps={}",
                         config.threshold_low, config.threshold_high, config.threshold_steps);
  }
  return sweep;
}

}  // namespace segeval::app
