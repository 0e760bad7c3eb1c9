#include <segeval/eval/aggregator.hpp>
#include <algorithm>

namespace segeval::eval {

namespace {

void accumulate(double& sum, std::uint32_t& count, const core::MetricValue& value) {
  if (!value) return;
  sum += *value;
  ++count;
}

core::MetricValue mean_of(double sum, std::uint32_t count) {
  if (count == 0) return std::nullopt;
  return sum / static_cast<double>(count);
}

/// Orders entries within one (class, kind) block: defined values descending,
/// undefined last, then sample index, then split.
bool better(const core::RankEntry& a, const core::RankEntry& b) {
  if (a.record.class_index != b.record.class_index) {
    return a.record.class_index < b.record.class_index;
  }
  if (a.kind != b.kind) return a.kind < b.kind;
  if (a.value.has_value() != b.value.has_value()) return a.value.has_value();
  if (a.value && *a.value != *b.value) return *a.value > *b.value;
  if (a.record.sample_index != b.record.sample_index) {
    return a.record.sample_index < b.record.sample_index;
  }
  return a.record.split < b.record.split;
}

}  // namespace

void Aggregator::add(const core::MetricRecord& record) {
  Group& g = groups_[GroupKey{record.split, record.sample_index, record.class_index}];
  accumulate(g.precision.sum, g.precision.count, record.precision);
  accumulate(g.recall.sum, g.recall.count, record.recall);
}

void Aggregator::add(std::span<const core::MetricRecord> records) {
  for (const auto& r : records) add(r);
}

void Aggregator::merge(const Aggregator& other) {
  for (const auto& [key, theirs] : other.groups_) {
    Group& ours = groups_[key];
    ours.precision.sum += theirs.precision.sum;
    ours.precision.count += theirs.precision.count;
    ours.recall.sum += theirs.recall.sum;
    ours.recall.count += theirs.recall.count;
  }
}

std::vector<core::AggregateRecord> Aggregator::results() const {
  std::vector<core::AggregateRecord> out;
  out.reserve(groups_.size());
  for (const auto& [key, g] : groups_) {
    core::AggregateRecord a;
    a.split = std::get<0>(key);
    a.sample_index = std::get<1>(key);
    a.class_index = std::get<2>(key);
    a.mean_precision = mean_of(g.precision.sum, g.precision.count);
    a.mean_recall = mean_of(g.recall.sum, g.recall.count);
    a.precision_count = g.precision.count;
    a.recall_count = g.recall.count;
    out.push_back(a);
  }
  return out;
}

std::vector<core::RankEntry> rank(std::span<const core::AggregateRecord> aggregates) {
  std::vector<core::RankEntry> ranking;
  ranking.reserve(aggregates.size() * 2);
  for (const auto& a : aggregates) {
    ranking.push_back({core::MetricKind::Precision, a.mean_precision, a});
    ranking.push_back({core::MetricKind::Recall, a.mean_recall, a});
  }
  std::sort(ranking.begin(), ranking.end(), better);
  return ranking;
}

std::vector<core::RankEntry> aggregate(std::span<const core::MetricRecord> records) {
  Aggregator aggregator;
  aggregator.add(records);
  const auto aggregates = aggregator.results();
  return rank(aggregates);
}

std::vector<core::RankEntry> top_k(const std::vector<core::RankEntry>& ranking,
                                   std::uint32_t class_index,
                                   core::MetricKind kind,
                                   std::size_t k,
                                   std::optional<core::Split> split) {
  std::vector<core::RankEntry> out;
  for (const auto& e : ranking) {
    if (out.size() >= k) break;
    if (e.record.class_index != class_index || e.kind != kind) continue;
    if (split && e.record.split != *split) continue;
    out.push_back(e);
  }
  return out;
}

}  // namespace segeval::eval
