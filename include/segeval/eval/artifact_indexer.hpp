#pragma once

#include <segeval/core/error.hpp>
#include <segeval/core/sample.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace segeval::eval {

/// Sample whose artifacts could not be paired. Reported to the caller, which
/// decides whether to skip it or abort the run.
struct IncompleteTriple {
  core::SampleKey key;
  /// IncompleteTriple (tags missing) or DuplicateArtifact (a tag seen twice).
  core::EvalError reason{core::EvalError::IncompleteTriple};
  std::vector<core::ArtifactTag> missing;
  std::vector<std::filesystem::path> present;
};

/// Result of one directory scan; both lists sorted by split, then index.
struct Catalogue {
  std::vector<core::SampleTriple> triples;
  std::vector<IncompleteTriple> incomplete;
};

struct IndexOptions {
  /// Only files with exactly this extension are considered.
  std::string extension{".npy"};
  std::vector<core::Split> splits{core::Split::Train, core::Split::Test};
};

/// Scans base_dir/{train,test} for files named <tag><index><extension>
/// (tag one of x, y, y_hat) and pairs them by (split, index).
/// Reads no array contents. InvalidLayout if base_dir is not a directory or
/// holds none of the requested split directories.
[[nodiscard]] std::expected<Catalogue, core::EvalError> index_artifacts(
    const std::filesystem::path& base_dir,
    const IndexOptions& options = {});

/// Description of an incomplete entry for logs and reports,
/// e.g. "test/7: missing y_hat".
[[nodiscard]] std::string describe(const IncompleteTriple& entry);

}  // namespace segeval::eval
