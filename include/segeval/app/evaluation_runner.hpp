#pragma once

#include <segeval/core/metric_record.hpp>
#include <segeval/core/sample.hpp>
#include <segeval/core/threshold_sweep.hpp>
#include <segeval/eval/array_loader.hpp>
#include <segeval/eval/metric_table.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <vector>

namespace segeval::app {

/// Callback for the records of each evaluated sample; may be invoked from
/// worker threads. Must be thread-safe if using a parallel runner.
using SampleRecordsCallback =
    std::function<void(const core::SampleKey&, const std::vector<core::MetricRecord>&)>;

/// Outcome of a batch: records of every evaluated sample, sorted by sample key
/// (class, then threshold within a sample), plus the samples that failed.
struct EvaluationReport {
  std::vector<core::MetricRecord> records;
  std::vector<eval::SkippedSample> failures;
  std::size_t evaluated{0};
  bool cancelled{false};
};

/// Loads one triple, evaluates it and releases its arrays before returning.
[[nodiscard]] std::expected<std::vector<core::MetricRecord>, core::EvalError>
evaluate_triple(const core::SampleTriple& triple,
                const eval::IArrayLoader& loader,
                const core::ThresholdSweep& sweep);

/// Evaluates triples sequentially in catalogue order. A failing sample is
/// logged and recorded in the report; the batch continues. If cancel is
/// non-null and becomes true, remaining samples are abandoned.
EvaluationReport run_evaluation(std::span<const core::SampleTriple> triples,
                                const eval::IArrayLoader& loader,
                                const core::ThresholdSweep& sweep,
                                SampleRecordsCallback callback = nullptr,
                                const std::atomic<bool>* cancel = nullptr);

/// Evaluates triples on a pool of worker threads; each worker holds at most one
/// loaded triple at a time. num_workers 0 = hardware concurrency. The report is
/// identical to run_evaluation's for the same input.
EvaluationReport run_evaluation_parallel(std::span<const core::SampleTriple> triples,
                                         const eval::IArrayLoader& loader,
                                         const core::ThresholdSweep& sweep,
                                         std::size_t num_workers = 0,
                                         SampleRecordsCallback callback = nullptr,
                                         const std::atomic<bool>* cancel = nullptr);

}  // namespace segeval::app
