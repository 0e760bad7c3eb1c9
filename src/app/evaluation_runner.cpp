#include <segeval/app/evaluation_runner.hpp>
#include <segeval/core/logger.hpp>
#include <segeval/eval/metrics_engine.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace segeval::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

bool cancelled(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load();
}

eval::SkippedSample failure_for(const core::SampleTriple& triple, core::EvalError error) {
  core::logger().warn("{}/{} skipped: {} (y_hat={})", core::to_string(triple.key.split),
                      triple.key.index, core::to_string(error), triple.y_hat.string());
  return {triple.key, error, triple.y_hat.string()};
}

void sort_report(EvaluationReport& report) {
  // Records of one sample are already class/threshold ordered; stable sort by key keeps that.
  std::stable_sort(report.records.begin(), report.records.end(),
                   [](const core::MetricRecord& a, const core::MetricRecord& b) {
                     return a.key() < b.key();
                   });
  std::sort(report.failures.begin(), report.failures.end(),
            [](const eval::SkippedSample& a, const eval::SkippedSample& b) {
              return a.key < b.key;
            });
}

}  // namespace

std::expected<std::vector<core::MetricRecord>, core::EvalError> evaluate_triple(
    const core::SampleTriple& triple,
    const eval::IArrayLoader& loader,
    const core::ThresholdSweep& sweep) {
  auto sample = loader.load_sample(triple);
  if (!sample) return std::unexpected(sample.error());
  return eval::evaluate_sample(*sample, sweep);
}

EvaluationReport run_evaluation(std::span<const core::SampleTriple> triples,
                                const eval::IArrayLoader& loader,
                                const core::ThresholdSweep& sweep,
                                SampleRecordsCallback callback,
                                const std::atomic<bool>* cancel) {
  EvaluationReport report;
  for (const auto& triple : triples) {
    if (cancelled(cancel)) {
      report.cancelled = true;
      break;
    }
    auto records = evaluate_triple(triple, loader, sweep);
    if (!records) {
      report.failures.push_back(failure_for(triple, records.error()));
      continue;
    }
    if (callback) callback(triple.key, *records);
    report.records.insert(report.records.end(), records->begin(), records->end());
    ++report.evaluated;
  }
  sort_report(report);
  return report;
}

EvaluationReport run_evaluation_parallel(std::span<const core::SampleTriple> triples,
                                         const eval::IArrayLoader& loader,
                                         const core::ThresholdSweep& sweep,
                                         std::size_t num_workers,
                                         SampleRecordsCallback callback,
                                         const std::atomic<bool>* cancel) {
  const std::size_t n = triples.size();
  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return run_evaluation(triples, loader, sweep, std::move(callback), cancel);
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  std::mutex queue_mutex;
  std::mutex report_mutex;
  EvaluationReport report;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        if (cancelled(cancel)) {
          std::lock_guard report_lock(report_mutex);
          report.cancelled = true;
          break;
        }
        idx = index_queue.front();
        index_queue.pop();
      }

      const auto& triple = triples[idx];
      auto records = evaluate_triple(triple, loader, sweep);
      if (!records) {
        auto failure = failure_for(triple, records.error());
        std::lock_guard lock(report_mutex);
        report.failures.push_back(std::move(failure));
        continue;
      }
      if (callback) callback(triple.key, *records);
      std::lock_guard lock(report_mutex);
      report.records.insert(report.records.end(), records->begin(), records->end());
      ++report.evaluated;
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  sort_report(report);
  return report;
}

}  // namespace segeval::app
