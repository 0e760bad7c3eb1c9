#pragma once

#include <segeval/core/error.hpp>
#include <segeval/core/metric_record.hpp>
#include <segeval/eval/artifact_indexer.hpp>
#include <expected>
#include <filesystem>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace segeval::eval {

/// Sample the runner skipped, for failures.csv / incomplete.csv.
struct SkippedSample {
  core::SampleKey key;
  core::EvalError reason{core::EvalError::None};
  std::string detail;
};

/// CSV writers for external tooling. Undefined metric values are written as
/// an empty field; numbers use the shortest round-trip representation.

/// split,sample_index,class,threshold,precision,recall,true_positive,predicted_positive,actual_positive
void write_metric_records(std::ostream& out, std::span<const core::MetricRecord> records);

/// split,sample_index,class,mean_precision,mean_recall,precision_count,recall_count
void write_aggregates(std::ostream& out, std::span<const core::AggregateRecord> aggregates);

/// class,metric,rank,split,sample_index,value  (rank is 1-based within class and metric)
void write_ranking(std::ostream& out, std::span<const core::RankEntry> ranking);

/// split,sample_index,reason,detail
void write_skipped(std::ostream& out, std::span<const SkippedSample> skipped);

/// Converts indexer findings into skipped-sample rows.
[[nodiscard]] std::vector<SkippedSample> to_skipped(std::span<const IncompleteTriple> incomplete);

/// Opens path for writing, runs writer on the stream and checks the result.
/// WriteFailed if the file cannot be opened or a write fails.
[[nodiscard]] std::expected<void, core::EvalError> write_csv_file(
    const std::filesystem::path& path,
    const std::function<void(std::ostream&)>& writer);

}  // namespace segeval::eval
