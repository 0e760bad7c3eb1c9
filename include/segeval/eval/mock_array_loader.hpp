#pragma once

#include <segeval/core/error.hpp>
#include <segeval/core/tensor.hpp>
#include <segeval/eval/array_loader.hpp>
#include <expected>
#include <filesystem>
#include <map>
#include <set>

namespace segeval::eval {

/// In-memory loader for tests and demos: returns tensors registered by path.
/// Unknown paths and paths marked with fail_on() yield ArtifactLoadFailed.
/// Register everything before sharing the loader across threads.
class MockArrayLoader : public IArrayLoader {
 public:
  void set_array(const std::filesystem::path& path, core::Tensor tensor);
  void fail_on(const std::filesystem::path& path);

  [[nodiscard]] std::expected<core::Tensor, core::EvalError> load(
      const std::filesystem::path& path) const override;

 private:
  std::map<std::filesystem::path, core::Tensor> arrays_;
  std::set<std::filesystem::path> failing_;
};

}  // namespace segeval::eval
