#include <segeval/eval/artifact_indexer.hpp>
#include <segeval/core/logger.hpp>
#include <algorithm>
#include <array>
#include <charconv>
#include <map>
#include <optional>
#include <string_view>
#include <system_error>

namespace segeval::eval {

namespace {

namespace fs = std::filesystem;

struct ParsedName {
  core::ArtifactTag tag;
  std::uint64_t index;
};

/// Longest tag first so "y_hat3" is not read as tag "y".
constexpr std::array<std::pair<std::string_view, core::ArtifactTag>, 3> kTagPrefixes = {{
    {"y_hat", core::ArtifactTag::YHat},
    {"x", core::ArtifactTag::X},
    {"y", core::ArtifactTag::Y},
}};

std::optional<ParsedName> parse_file_name(std::string_view name, std::string_view extension) {
  if (!name.ends_with(extension)) return std::nullopt;
  name.remove_suffix(extension.size());

  for (const auto& [prefix, tag] : kTagPrefixes) {
    if (!name.starts_with(prefix)) continue;
    const std::string_view digits = name.substr(prefix.size());
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
      return std::nullopt;
    }
    std::uint64_t index = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
    return ParsedName{tag, index};
  }
  return std::nullopt;
}

struct Group {
  std::array<std::optional<fs::path>, 3> paths;
  bool duplicate{false};
};

std::size_t slot(core::ArtifactTag tag) { return static_cast<std::size_t>(tag); }

}  // namespace

std::expected<Catalogue, core::EvalError> index_artifacts(const fs::path& base_dir,
                                                          const IndexOptions& options) {
  std::error_code ec;
  if (!fs::is_directory(base_dir, ec)) {
    core::logger().error("artifact base directory {} does not exist", base_dir.string());
    return std::unexpected(core::EvalError::InvalidLayout);
  }

  std::map<core::SampleKey, Group> groups;
  bool any_split = false;

  for (const core::Split split : options.splits) {
    const fs::path split_dir = base_dir / std::string(core::to_string(split));
    if (!fs::is_directory(split_dir, ec)) {
      core::logger().debug("no {} directory under {}", core::to_string(split), base_dir.string());
      continue;
    }
    any_split = true;

    for (fs::directory_iterator it(split_dir, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code entry_ec;
      const bool regular = it->is_regular_file(entry_ec);
      if (entry_ec) {
        core::logger().warn("skipping {}: {}", it->path().string(), entry_ec.message());
        continue;
      }
      if (!regular) continue;
      const std::string name = it->path().filename().string();
      auto parsed = parse_file_name(name, options.extension);
      if (!parsed) {
        core::logger().debug("ignoring {}", it->path().string());
        continue;
      }
      Group& group = groups[core::SampleKey{split, parsed->index}];
      auto& entry = group.paths[slot(parsed->tag)];
      if (entry) {
        core::logger().warn("{} and {} both map to {}/{} tag {}", entry->string(),
                            it->path().string(), core::to_string(split), parsed->index,
                            core::to_string(parsed->tag));
        group.duplicate = true;
        continue;
      }
      entry = it->path();
    }
    if (ec) {
      core::logger().error("cannot read {}: {}", split_dir.string(), ec.message());
      return std::unexpected(core::EvalError::InvalidLayout);
    }
  }

  if (!any_split) {
    core::logger().error("{} contains no train or test directory", base_dir.string());
    return std::unexpected(core::EvalError::InvalidLayout);
  }

  // std::map iteration gives split-then-index order.
  Catalogue catalogue;
  for (auto& [key, group] : groups) {
    IncompleteTriple problem;
    problem.key = key;
    for (const auto tag : {core::ArtifactTag::X, core::ArtifactTag::Y, core::ArtifactTag::YHat}) {
      const auto& p = group.paths[slot(tag)];
      if (p) problem.present.push_back(*p);
      else problem.missing.push_back(tag);
    }
    if (group.duplicate) problem.reason = core::EvalError::DuplicateArtifact;

    if (problem.missing.empty() && !group.duplicate) {
      catalogue.triples.push_back(core::SampleTriple{
          key, std::move(*group.paths[0]), std::move(*group.paths[1]),
          std::move(*group.paths[2])});
    } else {
      core::logger().warn("incomplete sample {}", describe(problem));
      catalogue.incomplete.push_back(std::move(problem));
    }
  }

  core::logger().debug("indexed {}: {} triples, {} incomplete", base_dir.string(),
                       catalogue.triples.size(), catalogue.incomplete.size());
  return catalogue;
}

std::string describe(const IncompleteTriple& entry) {
  std::string out(core::to_string(entry.key.split));
  out += "/" + std::to_string(entry.key.index) + ":";
  if (entry.reason == core::EvalError::DuplicateArtifact) {
    out += " duplicate artifact";
  }
  if (!entry.missing.empty()) {
    out += " missing";
    for (std::size_t i = 0; i < entry.missing.size(); ++i) {
      out += (i == 0 ? " " : ", ");
      out += core::to_string(entry.missing[i]);
    }
  }
  return out;
}

}  // namespace segeval::eval
