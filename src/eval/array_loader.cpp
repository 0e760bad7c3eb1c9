#include <segeval/eval/array_loader.hpp>

namespace segeval::eval {

std::expected<core::LoadedSample, core::EvalError> IArrayLoader::load_sample(
    const core::SampleTriple& triple) const {
  core::LoadedSample sample;
  sample.key = triple.key;

  auto x = load(triple.x);
  if (!x) return std::unexpected(x.error());
  auto y = load(triple.y);
  if (!y) return std::unexpected(y.error());
  auto y_hat = load(triple.y_hat);
  if (!y_hat) return std::unexpected(y_hat.error());

  sample.x = std::move(*x);
  sample.y = std::move(*y);
  sample.y_hat = std::move(*y_hat);
  return sample;
}

}  // namespace segeval::eval
