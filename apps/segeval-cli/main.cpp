/**
 * segeval-cli: evaluate saved segmentation predictions against ground truth.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/segeval_cli [--config path] [--base-dir path] [--output-dir path]
 * Writes metrics.csv, aggregates.csv, ranking.csv, incomplete.csv and
 * failures.csv into the output directory.
 */

#include <segeval/app/config.hpp>
#include <segeval/app/evaluation_runner.hpp>
#ifdef SEGEVAL_HAS_TBB
#include <segeval/app/evaluation_runner_tbb.hpp>
#include <tbb/global_control.h>
#endif
#include <segeval/core/logger.hpp>
#include <segeval/core/threshold_sweep.hpp>
#include <segeval/eval/aggregator.hpp>
#include <segeval/eval/artifact_indexer.hpp>
#include <segeval/eval/metric_table.hpp>
#include <segeval/eval/npy_array_loader.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: segeval_cli [options]\n"
            << "  --config <path>      Evaluation config (key=value file); default: built-in\n"
            << "  --base-dir <path>    Artifact root holding train/ and test/\n"
            << "  --output-dir <path>  Directory for CSV exports (default: output)\n"
            << "  --low <t>            Lowest threshold, in (0,1)\n"
            << "  --high <t>           Highest threshold, in (0,1)\n"
            << "  --steps <n>          Number of thresholds\n"
            << "  --workers <n>        Worker threads (0 = all cores, 1 = sequential)\n"
            << "  --log-level <name>   trace | debug | info | warn | error | off\n";
}

int write_outputs(const std::filesystem::path& out_dir,
                  const segeval::eval::Catalogue& catalogue,
                  const segeval::app::EvaluationReport& report,
                  const std::vector<segeval::core::AggregateRecord>& aggregates,
                  const std::vector<segeval::core::RankEntry>& ranking) {
  using namespace segeval::eval;

  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    segeval::core::logger().error("cannot create {}: {}", out_dir.string(), ec.message());
    return 1;
  }

  const std::vector<SkippedSample> incomplete = to_skipped(catalogue.incomplete);
  const bool ok =
      write_csv_file(out_dir / "metrics.csv",
                     [&](std::ostream& o) { write_metric_records(o, report.records); }) &&
      write_csv_file(out_dir / "aggregates.csv",
                     [&](std::ostream& o) { write_aggregates(o, aggregates); }) &&
      write_csv_file(out_dir / "ranking.csv",
                     [&](std::ostream& o) { write_ranking(o, ranking); }) &&
      write_csv_file(out_dir / "incomplete.csv",
                     [&](std::ostream& o) { write_skipped(o, incomplete); }) &&
      write_csv_file(out_dir / "failures.csv",
                     [&](std::ostream& o) { write_skipped(o, report.failures); });
  return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string base_dir_override;
  std::string output_dir_override;
  std::string low_override;
  std::string high_override;
  std::string steps_override;
  std::string workers_override;
  std::string log_level_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--base-dir" && i + 1 < argc) {
      base_dir_override = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      output_dir_override = argv[++i];
    } else if (arg == "--low" && i + 1 < argc) {
      low_override = argv[++i];
    } else if (arg == "--high" && i + 1 < argc) {
      high_override = argv[++i];
    } else if (arg == "--steps" && i + 1 < argc) {
      steps_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  segeval::app::EvalConfig cfg = config_path.empty() ? segeval::app::default_config()
                                                     : segeval::app::load_config(config_path);
  try {
    if (!base_dir_override.empty()) cfg.base_dir = base_dir_override;
    if (!output_dir_override.empty()) cfg.output_dir = output_dir_override;
    if (!low_override.empty()) cfg.threshold_low = std::stod(low_override);
    if (!high_override.empty()) cfg.threshold_high = std::stod(high_override);
    if (!steps_override.empty()) cfg.threshold_steps = segeval::app::parse_count(steps_override);
    if (!workers_override.empty()) cfg.num_workers = segeval::app::parse_count(workers_override);
    if (!log_level_override.empty()) cfg.log_level = log_level_override;
  } catch (const std::exception& e) {
    std::cerr << "Invalid numeric option: " << e.what() << "\n";
    return 1;
  }

  if (!segeval::core::set_log_level(cfg.log_level)) {
    std::cerr << "Unknown log level " << cfg.log_level << "\n";
    return 1;
  }
  auto& log = segeval::core::logger();

  auto sweep = segeval::app::validate_config(cfg);
  if (!sweep) {
    std::cerr << "Invalid configuration: " << segeval::core::to_string(sweep.error()) << "\n";
    return 1;
  }

  segeval::eval::IndexOptions index_options;
  index_options.extension = cfg.extension;
  index_options.splits = cfg.splits;
  auto catalogue = segeval::eval::index_artifacts(cfg.base_dir, index_options);
  if (!catalogue) {
    std::cerr << "Indexing " << cfg.base_dir
              << " failed: " << segeval::core::to_string(catalogue.error()) << "\n";
    return 1;
  }
  log.info("indexed {} complete samples, {} incomplete", catalogue->triples.size(),
           catalogue->incomplete.size());
  if (cfg.abort_on_incomplete && !catalogue->incomplete.empty()) {
    std::cerr << catalogue->incomplete.size()
              << " incomplete samples and abort_on_incomplete=true\n";
    return 1;
  }

  const segeval::eval::NpyArrayLoader loader;
#ifdef SEGEVAL_HAS_TBB
  std::optional<tbb::global_control> thread_limiter;
  if (cfg.num_workers > 0) {
    thread_limiter.emplace(tbb::global_control::max_allowed_parallelism, cfg.num_workers);
  }
  auto evaluation = segeval::app::run_evaluation_tbb(catalogue->triples, loader, *sweep);
  const segeval::app::EvaluationReport& report = evaluation.report;
  const auto aggregates = evaluation.aggregator.results();
#else
  const segeval::app::EvaluationReport report = segeval::app::run_evaluation_parallel(
      catalogue->triples, loader, *sweep, cfg.num_workers);
  segeval::eval::Aggregator aggregator;
  aggregator.add(report.records);
  const auto aggregates = aggregator.results();
#endif
  const auto ranking = segeval::eval::rank(aggregates);

  log.info("evaluated {} samples over {} thresholds, {} failed", report.evaluated,
           sweep->size(), report.failures.size());

  const int rc = write_outputs(cfg.output_dir, *catalogue, report, aggregates, ranking);
  if (rc == 0) {
    std::cout << "evaluated=" << report.evaluated << " failed=" << report.failures.size()
              << " incomplete=" << catalogue->incomplete.size() << " output=" << cfg.output_dir
              << "\n";
  }
  return rc;
}
