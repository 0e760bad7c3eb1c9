#include <segeval/eval/metric_table.hpp>
#include <segeval/core/logger.hpp>
#include <spdlog/fmt/fmt.h>
#include <fstream>

namespace segeval::eval {

namespace {

std::string field(const core::MetricValue& v) {
  return v ? fmt::format("{}", *v) : std::string();
}

/// Quotes a free-text field when it contains a separator or quote.
std::string quoted(const std::string& text) {
  if (text.find_first_of(",\"\n") == std::string::npos) return text;
  std::string out = "\"";
  for (const char c : text) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

}  // namespace

void write_metric_records(std::ostream& out, std::span<const core::MetricRecord> records) {
  out << "split,sample_index,class,threshold,precision,recall,true_positive,"
         "predicted_positive,actual_positive\n";
  for (const auto& r : records) {
    out << fmt::format("{},{},{},{},{},{},{},{},{}\n", core::to_string(r.split),
                       r.sample_index, r.class_index, r.threshold, field(r.precision),
                       field(r.recall), r.true_positive, r.predicted_positive,
                       r.actual_positive);
  }
}

void write_aggregates(std::ostream& out, std::span<const core::AggregateRecord> aggregates) {
  out << "split,sample_index,class,mean_precision,mean_recall,precision_count,recall_count\n";
  for (const auto& a : aggregates) {
    out << fmt::format("{},{},{},{},{},{},{}\n", core::to_string(a.split), a.sample_index,
                       a.class_index, field(a.mean_precision), field(a.mean_recall),
                       a.precision_count, a.recall_count);
  }
}

void write_ranking(std::ostream& out, std::span<const core::RankEntry> ranking) {
  out << "class,metric,rank,split,sample_index,value\n";
  std::size_t position = 0;
  for (std::size_t i = 0; i < ranking.size(); ++i) {
    const auto& e = ranking[i];
    const bool new_block = i == 0 || ranking[i - 1].record.class_index != e.record.class_index ||
                           ranking[i - 1].kind != e.kind;
    position = new_block ? 1 : position + 1;
    out << fmt::format("{},{},{},{},{},{}\n", e.record.class_index, core::to_string(e.kind),
                       position, core::to_string(e.record.split), e.record.sample_index,
                       field(e.value));
  }
}

void write_skipped(std::ostream& out, std::span<const SkippedSample> skipped) {
  out << "split,sample_index,reason,detail\n";
  for (const auto& s : skipped) {
    out << fmt::format("{},{},{},{}\n", core::to_string(s.key.split), s.key.index,
                       core::to_string(s.reason), quoted(s.detail));
  }
}

std::vector<SkippedSample> to_skipped(std::span<const IncompleteTriple> incomplete) {
  std::vector<SkippedSample> out;
  out.reserve(incomplete.size());
  for (const auto& entry : incomplete) {
    out.push_back({entry.key, entry.reason, describe(entry)});
  }
  return out;
}

std::expected<void, core::EvalError> write_csv_file(
    const std::filesystem::path& path,
    const std::function<void(std::ostream&)>& writer) {
  std::ofstream f(path, std::ios::trunc);
  if (!f) {
    core::logger().error("cannot open {} for writing", path.string());
    return std::unexpected(core::EvalError::WriteFailed);
  }
  writer(f);
  f.flush();
  if (!f) {
    core::logger().error("failed writing {}", path.string());
    return std::unexpected(core::EvalError::WriteFailed);
  }
  return {};
}

}  // namespace segeval::eval
