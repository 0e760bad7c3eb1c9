#include <segeval/core/error.hpp>
#include <segeval/core/metric_record.hpp>
#include <segeval/core/threshold_sweep.hpp>
#include <segeval/eval/metrics_engine.hpp>
#include "tensor_test_utils.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

namespace sc = segeval::core;
namespace se = segeval::eval;
using segeval::test::filled;
using segeval::test::make_tensor;

namespace {

sc::ThresholdSweep sweep_of(std::vector<double> values) {
  return *sc::ThresholdSweep::from_values(std::move(values));
}

}  // namespace

// Two classes, 2x2 tiles. Class 0: y = [[1,0],[0,0]].
TEST(MetricsEngine, ConfidentCorrectPredictionScoresOne) {
  const auto y = make_tensor(2, 2, {{1, 0, 0, 0}, {0, 1, 1, 0}});
  const auto y_hat = make_tensor(2, 2, {{0.8f, 0.1f, 0.2f, 0.3f}, {0.1f, 0.9f, 0.7f, 0.2f}});
  auto records = se::evaluate(y, y_hat, sweep_of({0.5}));
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 2u);

  const auto& r = (*records)[0];
  EXPECT_EQ(r.class_index, 0u);
  EXPECT_EQ(r.predicted_positive, 1u);
  EXPECT_DOUBLE_EQ(r.true_positive, 1.0);
  ASSERT_TRUE(r.precision.has_value());
  ASSERT_TRUE(r.recall.has_value());
  EXPECT_DOUBLE_EQ(*r.precision, 1.0);
  EXPECT_DOUBLE_EQ(*r.recall, 1.0);
}

TEST(MetricsEngine, NoPredictedPositivesLeavesPrecisionUndefined) {
  const auto y = make_tensor(2, 2, {{1, 0, 0, 0}, {0, 0, 0, 0}});
  const auto y_hat = make_tensor(2, 2, {{0.1f, 0.1f, 0.1f, 0.1f}, {0.1f, 0.1f, 0.1f, 0.1f}});
  auto records = se::evaluate(y, y_hat, sweep_of({0.5}));
  ASSERT_TRUE(records.has_value());

  const auto& r = (*records)[0];
  EXPECT_EQ(r.predicted_positive, 0u);
  EXPECT_FALSE(r.precision.has_value());
  ASSERT_TRUE(r.recall.has_value());
  EXPECT_DOUBLE_EQ(*r.recall, 0.0);
}

TEST(MetricsEngine, ThresholdIsStrict) {
  const auto y = make_tensor(1, 2, {{1, 0}});
  const auto y_hat = make_tensor(1, 2, {{0.5f, 0.5f}});
  auto records = se::evaluate(y, y_hat, sweep_of({0.5}));
  ASSERT_TRUE(records.has_value());
  EXPECT_EQ((*records)[0].predicted_positive, 0u);
  EXPECT_FALSE((*records)[0].precision.has_value());
}

TEST(MetricsEngine, IdenticalPredictionIsPerfect) {
  const auto y = make_tensor(3, 3, {{1, 0, 1, 0, 1, 0, 1, 1, 0},
                                    {0, 1, 0, 1, 0, 1, 0, 0, 1},
                                    {0, 0, 0, 0, 0, 0, 0, 0, 0}});
  const auto y_hat = y;
  auto records = se::evaluate(y, y_hat, *sc::ThresholdSweep::linear(0.1, 0.9, 9));
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 27u);
  for (const auto& r : *records) {
    if (r.class_index < 2) {
      ASSERT_TRUE(r.precision && r.recall);
      EXPECT_DOUBLE_EQ(*r.precision, 1.0);
      EXPECT_DOUBLE_EQ(*r.recall, 1.0);
    } else {
      // All-zero class: nothing predicted, nothing to find.
      EXPECT_FALSE(r.precision.has_value());
      EXPECT_FALSE(r.recall.has_value());
    }
  }
}

TEST(MetricsEngine, AllZeroPredictionRecallZeroPrecisionUndefined) {
  const auto y = make_tensor(2, 2, {{0, 1, 1, 0}});
  const auto y_hat = filled(y.shape(), 0.f);
  auto records = se::evaluate(y, y_hat, *sc::ThresholdSweep::linear(0.1, 0.9, 5));
  ASSERT_TRUE(records.has_value());
  for (const auto& r : *records) {
    EXPECT_FALSE(r.precision.has_value());
    ASSERT_TRUE(r.recall.has_value());
    EXPECT_EQ(*r.recall, 0.0);
  }
}

TEST(MetricsEngine, NoGroundTruthLeavesRecallUndefined) {
  const auto y = filled(sc::Shape{1, 2, 2}, 0.f);
  const auto y_hat = make_tensor(2, 2, {{0.95f, 0.6f, 0.3f, 0.05f}});
  auto records = se::evaluate(y, y_hat, *sc::ThresholdSweep::linear(0.1, 0.9, 9));
  ASSERT_TRUE(records.has_value());
  bool saw_defined_precision = false;
  for (const auto& r : *records) {
    EXPECT_FALSE(r.recall.has_value());
    if (r.precision) {
      saw_defined_precision = true;
      EXPECT_EQ(*r.precision, 0.0);
    }
  }
  EXPECT_TRUE(saw_defined_precision);
}

TEST(MetricsEngine, RecallAndPredictedCountNonIncreasing) {
  const auto y = make_tensor(3, 3, {{1, 1, 0, 1, 0, 0, 1, 0, 1}});
  const auto y_hat = make_tensor(3, 3, {{0.95f, 0.4f, 0.6f, 0.75f, 0.15f, 0.55f, 0.35f, 0.05f, 0.85f}});
  auto records = se::evaluate(y, y_hat, *sc::ThresholdSweep::linear(0.1, 0.9, 17));
  ASSERT_TRUE(records.has_value());
  for (std::size_t i = 1; i < records->size(); ++i) {
    const auto& prev = (*records)[i - 1];
    const auto& cur = (*records)[i];
    EXPECT_LE(cur.predicted_positive, prev.predicted_positive);
    ASSERT_TRUE(prev.recall && cur.recall);
    EXPECT_LE(*cur.recall, *prev.recall);
  }
  // Precision is not monotonic in the threshold, so nothing is asserted about its direction.
}

TEST(MetricsEngine, OrdersByClassThenThreshold) {
  const auto y = make_tensor(1, 2, {{1, 0}, {0, 1}, {1, 1}});
  const auto y_hat = make_tensor(1, 2, {{0.9f, 0.1f}, {0.2f, 0.8f}, {0.6f, 0.4f}});
  const auto sweep = sweep_of({0.25, 0.5, 0.75});
  auto records = se::evaluate(y, y_hat, sweep, {sc::Split::Test, 42});
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 9u);
  for (std::size_t i = 0; i < records->size(); ++i) {
    const auto& r = (*records)[i];
    EXPECT_EQ(r.class_index, i / 3);
    EXPECT_EQ(r.threshold, sweep[i % 3]);
    EXPECT_EQ(r.split, sc::Split::Test);
    EXPECT_EQ(r.sample_index, 42u);
  }
}

TEST(MetricsEngine, PartialOverlapScores) {
  // 4 predicted at 0.5, 2 of them true; 3 true pixels in total.
  const auto y = make_tensor(2, 3, {{1, 1, 0, 0, 0, 1}});
  const auto y_hat = make_tensor(2, 3, {{0.9f, 0.2f, 0.7f, 0.6f, 0.1f, 0.8f}});
  auto records = se::evaluate(y, y_hat, sweep_of({0.5}));
  ASSERT_TRUE(records.has_value());
  const auto& r = (*records)[0];
  EXPECT_EQ(r.predicted_positive, 4u);
  EXPECT_DOUBLE_EQ(r.actual_positive, 3.0);
  EXPECT_DOUBLE_EQ(*r.precision, 0.5);
  EXPECT_DOUBLE_EQ(*r.recall, 2.0 / 3.0);
}

TEST(MetricsEngine, ScoreChannelMatchesEvaluate) {
  const auto y = make_tensor(2, 2, {{1, 0, 0, 1}});
  const auto y_hat = make_tensor(2, 2, {{0.7f, 0.6f, 0.2f, 0.1f}});
  const auto s = se::score_channel(y, y_hat, 0, 0.5);
  EXPECT_EQ(s.predicted_positive, 2u);
  EXPECT_DOUBLE_EQ(*s.precision, 0.5);
  EXPECT_DOUBLE_EQ(*s.recall, 0.5);
}

TEST(MetricsEngine, ShapeMismatchIsError) {
  const auto y = filled(sc::Shape{2, 2, 2}, 0.f);
  const auto y_hat = filled(sc::Shape{3, 2, 2}, 0.f);
  auto records = se::evaluate(y, y_hat, sweep_of({0.5}));
  ASSERT_FALSE(records.has_value());
  EXPECT_EQ(records.error(), sc::EvalError::ShapeMismatch);
}

TEST(MetricsEngine, NonFiniteDataIsError) {
  const auto y = make_tensor(1, 2, {{1, 0}});
  const auto y_hat = make_tensor(1, 2, {{std::numeric_limits<float>::quiet_NaN(), 0.2f}});
  auto records = se::evaluate(y, y_hat, sweep_of({0.5}));
  ASSERT_FALSE(records.has_value());
  EXPECT_EQ(records.error(), sc::EvalError::NonNumericData);
}

TEST(MetricsEngine, EmptyInputIsError) {
  auto records = se::evaluate(sc::Tensor{}, sc::Tensor{}, sweep_of({0.5}));
  ASSERT_FALSE(records.has_value());
  EXPECT_EQ(records.error(), sc::EvalError::EmptyArtifact);
}

TEST(MetricsEngine, ValidateSampleChecksInputSpatialExtent) {
  sc::LoadedSample sample;
  sample.x = filled(sc::Shape{10, 2, 2}, 0.f);
  sample.y = filled(sc::Shape{2, 2, 2}, 0.f);
  sample.y_hat = filled(sc::Shape{2, 2, 2}, 0.f);
  EXPECT_TRUE(se::validate_sample(sample).has_value());

  sample.x = filled(sc::Shape{10, 2, 3}, 0.f);
  auto invalid = se::validate_sample(sample);
  ASSERT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error(), sc::EvalError::ShapeMismatch);
  EXPECT_EQ(se::evaluate_sample(sample, sweep_of({0.5})).error(), sc::EvalError::ShapeMismatch);
}
