#include <segeval/app/evaluation_runner_tbb.hpp>
#include <segeval/core/logger.hpp>
#include <tbb/blocked_range.h>
#include <tbb/combinable.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

#ifdef SEGEVAL_HAS_TBB

namespace segeval::app {

TbbEvaluation run_evaluation_tbb(std::span<const core::SampleTriple> triples,
                                 const eval::IArrayLoader& loader,
                                 const core::ThresholdSweep& sweep,
                                 SampleRecordsCallback callback,
                                 const std::atomic<bool>* cancel) {
  TbbEvaluation out;
  const std::size_t n = triples.size();
  if (n == 0) return out;

  using Outcome = std::expected<std::vector<core::MetricRecord>, core::EvalError>;
  // One slot per triple, written by exactly one task; nullopt = not started.
  std::vector<std::optional<Outcome>> outcomes(n);
  tbb::combinable<eval::Aggregator> partials;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (cancel != nullptr && cancel->load()) return;
          auto records = evaluate_triple(triples[i], loader, sweep);
          if (records) {
            partials.local().add(*records);
            if (callback) callback(triples[i].key, *records);
          }
          outcomes[i] = std::move(records);
        }
      });

  partials.combine_each([&out](const eval::Aggregator& partial) {
    out.aggregator.merge(partial);
  });

  for (std::size_t i = 0; i < n; ++i) {
    if (!outcomes[i]) {
      out.report.cancelled = true;
      continue;
    }
    const auto& triple = triples[i];
    if (!*outcomes[i]) {
      const core::EvalError error = outcomes[i]->error();
      core::logger().warn("{}/{} skipped: {} (y_hat={})", core::to_string(triple.key.split),
                          triple.key.index, core::to_string(error), triple.y_hat.string());
      out.report.failures.push_back({triple.key, error, triple.y_hat.string()});
      continue;
    }
    const auto& records = **outcomes[i];
    out.report.records.insert(out.report.records.end(), records.begin(), records.end());
    ++out.report.evaluated;
  }
  std::stable_sort(out.report.records.begin(), out.report.records.end(),
                   [](const core::MetricRecord& a, const core::MetricRecord& b) {
                     return a.key() < b.key();
                   });
  std::sort(out.report.failures.begin(), out.report.failures.end(),
            [](const eval::SkippedSample& a, const eval::SkippedSample& b) {
              return a.key < b.key;
            });
  return out;
}

}  // namespace segeval::app

#endif  // SEGEVAL_HAS_TBB
