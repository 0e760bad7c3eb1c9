#include <segeval/eval/metrics_engine.hpp>
#include "tensor_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace segeval::eval {

namespace {

ChannelScore score_views(const cv::Mat& truth, const cv::Mat& prob, double threshold,
                         double actual_positive) {
  ChannelScore s;
  s.actual_positive = actual_positive;

  cv::Mat mask;  // CV_8U, 255 where predicted positive
  cv::compare(prob, threshold, mask, cv::CMP_GT);
  s.predicted_positive = static_cast<std::uint64_t>(cv::countNonZero(mask));

  if (s.predicted_positive > 0) {
    cv::Mat pred;
    mask.convertTo(pred, CV_32F, 1.0 / 255.0);
    s.true_positive = pred.dot(truth);
    s.precision = s.true_positive / static_cast<double>(s.predicted_positive);
  }
  if (actual_positive > 0.0) {
    s.recall = s.true_positive / actual_positive;
  }
  return s;
}

}  // namespace

ChannelScore score_channel(const core::Tensor& y,
                           const core::Tensor& y_hat,
                           std::uint32_t class_index,
                           double threshold) {
  const cv::Mat truth = detail::channel_view(y, class_index);
  const cv::Mat prob = detail::channel_view(y_hat, class_index);
  return score_views(truth, prob, threshold, cv::sum(truth)[0]);
}

std::expected<std::vector<core::MetricRecord>, core::EvalError> evaluate(
    const core::Tensor& y,
    const core::Tensor& y_hat,
    const core::ThresholdSweep& sweep,
    const core::SampleKey& key) {
  if (y.empty() || y_hat.empty()) {
    return std::unexpected(core::EvalError::EmptyArtifact);
  }
  if (y.shape() != y_hat.shape()) {
    return std::unexpected(core::EvalError::ShapeMismatch);
  }
  if (!detail::all_finite(y) || !detail::all_finite(y_hat)) {
    return std::unexpected(core::EvalError::NonNumericData);
  }

  std::vector<core::MetricRecord> records;
  records.reserve(static_cast<std::size_t>(y.channels()) * sweep.size());

  for (std::uint32_t k = 0; k < y.channels(); ++k) {
    const cv::Mat truth = detail::channel_view(y, k);
    const cv::Mat prob = detail::channel_view(y_hat, k);
    const double actual_positive = cv::sum(truth)[0];

    for (const double t : sweep) {
      const ChannelScore s = score_views(truth, prob, t, actual_positive);
      core::MetricRecord r;
      r.split = key.split;
      r.sample_index = key.index;
      r.class_index = k;
      r.threshold = t;
      r.precision = s.precision;
      r.recall = s.recall;
      r.true_positive = s.true_positive;
      r.predicted_positive = s.predicted_positive;
      r.actual_positive = s.actual_positive;
      records.push_back(r);
    }
  }
  return records;
}

std::expected<void, core::EvalError> validate_sample(const core::LoadedSample& sample) {
  if (sample.x.empty() || sample.y.empty() || sample.y_hat.empty()) {
    return std::unexpected(core::EvalError::EmptyArtifact);
  }
  if (sample.y.shape() != sample.y_hat.shape() ||
      !sample.x.same_spatial_extent(sample.y)) {
    return std::unexpected(core::EvalError::ShapeMismatch);
  }
  return {};
}

std::expected<std::vector<core::MetricRecord>, core::EvalError> evaluate_sample(
    const core::LoadedSample& sample,
    const core::ThresholdSweep& sweep) {
  if (auto valid = validate_sample(sample); !valid) {
    return std::unexpected(valid.error());
  }
  return evaluate(sample.y, sample.y_hat, sweep, sample.key);
}

}  // namespace segeval::eval
