#pragma once

#include <segeval/core/error.hpp>
#include <segeval/core/metric_record.hpp>
#include <segeval/core/sample.hpp>
#include <segeval/core/tensor.hpp>
#include <segeval/core/threshold_sweep.hpp>
#include <expected>
#include <vector>

namespace segeval::eval {

/// Counts and scores of one class channel at one threshold.
struct ChannelScore {
  double true_positive{0.0};
  std::uint64_t predicted_positive{0};
  double actual_positive{0.0};
  core::MetricValue precision;
  core::MetricValue recall;
};

/// Scores one class channel: pixels with y_hat[k] > threshold (strict) are
/// predicted positive; intersection = sum(pred * y[k]).
/// precision = intersection / sum(pred), undefined when nothing is predicted.
/// recall = intersection / sum(y[k]), undefined when the ground truth has no
/// positive pixel for the class.
/// Preconditions (not checked): shapes equal, class_index in range.
[[nodiscard]] ChannelScore score_channel(const core::Tensor& y,
                                         const core::Tensor& y_hat,
                                         std::uint32_t class_index,
                                         double threshold);

/// Precision/recall for every class channel and every threshold of the sweep.
///
/// Output order: class ascending, then threshold ascending (sweep order).
/// Recall and the predicted-positive count are non-increasing in the
/// threshold; precision is not monotonic.
///
/// Errors (hard failure for the sample, never masked):
///  - EmptyArtifact: y or y_hat has no elements
///  - ShapeMismatch: y and y_hat shapes differ
///  - NonNumericData: y or y_hat contains NaN or infinity
[[nodiscard]] std::expected<std::vector<core::MetricRecord>, core::EvalError> evaluate(
    const core::Tensor& y,
    const core::Tensor& y_hat,
    const core::ThresholdSweep& sweep,
    const core::SampleKey& key = {});

/// Checks the triple invariants: y and y_hat identical shape, x with the same
/// spatial extent (channel count may differ), nothing empty.
[[nodiscard]] std::expected<void, core::EvalError> validate_sample(
    const core::LoadedSample& sample);

/// validate_sample + evaluate on a loaded triple.
[[nodiscard]] std::expected<std::vector<core::MetricRecord>, core::EvalError> evaluate_sample(
    const core::LoadedSample& sample,
    const core::ThresholdSweep& sweep);

}  // namespace segeval::eval
