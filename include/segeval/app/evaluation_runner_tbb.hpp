#pragma once

#include <segeval/app/evaluation_runner.hpp>
#include <segeval/core/sample.hpp>
#include <segeval/core/threshold_sweep.hpp>
#include <segeval/eval/aggregator.hpp>
#include <segeval/eval/array_loader.hpp>
#include <span>

#ifdef SEGEVAL_HAS_TBB

namespace segeval::app {

/// Report plus the aggregator built from per-thread partials.
struct TbbEvaluation {
  EvaluationReport report;
  eval::Aggregator aggregator;
};

/// Evaluates triples with tbb::parallel_for.
///
/// Each task loads, scores and releases one triple. Metric records feed a
/// per-thread Aggregator (tbb::combinable); the partials are merged once all
/// tasks finish, so no lock is taken on the hot path. Report contents match
/// run_evaluation for the same input.
///
/// \param loader Shared by all tasks; must be safe to call concurrently.
/// \param callback Invoked per evaluated sample from TBB worker threads. Must be thread-safe.
/// \param cancel Optional flag; once set, tasks not yet started are skipped.
TbbEvaluation run_evaluation_tbb(std::span<const core::SampleTriple> triples,
                                 const eval::IArrayLoader& loader,
                                 const core::ThresholdSweep& sweep,
                                 SampleRecordsCallback callback = nullptr,
                                 const std::atomic<bool>* cancel = nullptr);

}  // namespace segeval::app

#endif  // SEGEVAL_HAS_TBB
