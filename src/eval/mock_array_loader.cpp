#include <segeval/eval/mock_array_loader.hpp>

namespace segeval::eval {

void MockArrayLoader::set_array(const std::filesystem::path& path, core::Tensor tensor) {
  arrays_[path] = std::move(tensor);
}

void MockArrayLoader::fail_on(const std::filesystem::path& path) {
  failing_.insert(path);
}

std::expected<core::Tensor, core::EvalError> MockArrayLoader::load(
    const std::filesystem::path& path) const {
  if (failing_.contains(path)) {
    return std::unexpected(core::EvalError::ArtifactLoadFailed);
  }
  auto it = arrays_.find(path);
  if (it == arrays_.end()) {
    return std::unexpected(core::EvalError::ArtifactLoadFailed);
  }
  return it->second;
}

}  // namespace segeval::eval
