#pragma once

#include <segeval/core/metric_record.hpp>
#include <segeval/core/sample.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ranges>
#include <span>
#include <tuple>
#include <vector>

namespace segeval::eval {

/// Sum-and-count accumulator of metric records per (split, sample, class).
/// Undefined values are excluded from both sum and count. Partial
/// accumulators built on different threads combine with merge(); the result
/// does not depend on the order records or partials arrive in.
class Aggregator {
 public:
  void add(const core::MetricRecord& record);
  void add(std::span<const core::MetricRecord> records);

  /// Adds the sums and counts of other into this accumulator.
  void merge(const Aggregator& other);

  /// One AggregateRecord per group, sorted by split, sample index, class.
  [[nodiscard]] std::vector<core::AggregateRecord> results() const;

  [[nodiscard]] std::size_t group_count() const noexcept { return groups_.size(); }
  [[nodiscard]] bool empty() const noexcept { return groups_.empty(); }

 private:
  struct Accumulator {
    double sum{0.0};
    std::uint32_t count{0};
  };
  struct Group {
    Accumulator precision;
    Accumulator recall;
  };
  using GroupKey = std::tuple<core::Split, std::uint64_t, std::uint32_t>;

  std::map<GroupKey, Group> groups_;
};

/// Ranking of aggregates: class ascending, then metric kind (precision before
/// recall), then mean value descending with undefined means last; ties by
/// sample index ascending, then split (train before test).
[[nodiscard]] std::vector<core::RankEntry> rank(
    std::span<const core::AggregateRecord> aggregates);

/// Accumulates records and ranks the resulting aggregates.
[[nodiscard]] std::vector<core::RankEntry> aggregate(
    std::span<const core::MetricRecord> records);

/// Read-only view of the ranking restricted to one split; no copy is made.
[[nodiscard]] inline auto filter_split(const std::vector<core::RankEntry>& ranking,
                                       core::Split split) {
  return ranking | std::views::filter([split](const core::RankEntry& e) {
           return e.record.split == split;
         });
}

/// The view refers into the ranking, which must outlive it.
void filter_split(std::vector<core::RankEntry>&&, core::Split) = delete;

/// First k entries of the ranking for one class and metric kind, optionally
/// restricted to one split; the best-scoring samples come first.
[[nodiscard]] std::vector<core::RankEntry> top_k(
    const std::vector<core::RankEntry>& ranking,
    std::uint32_t class_index,
    core::MetricKind kind,
    std::size_t k,
    std::optional<core::Split> split = std::nullopt);

}  // namespace segeval::eval
