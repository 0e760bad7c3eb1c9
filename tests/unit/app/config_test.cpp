#include <segeval/app/config.hpp>
#include <segeval/core/error.hpp>
#include "tensor_test_utils.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>

namespace sa = segeval::app;
namespace sc = segeval::core;
using segeval::test::TempDir;

TEST(EvalConfig, Defaults) {
  const auto c = sa::default_config();
  EXPECT_TRUE(c.base_dir.empty());
  EXPECT_EQ(c.output_dir, "output");
  EXPECT_DOUBLE_EQ(c.threshold_low, 0.1);
  EXPECT_DOUBLE_EQ(c.threshold_high, 0.9);
  EXPECT_EQ(c.threshold_steps, 9u);
  EXPECT_EQ(c.extension, ".npy");
  EXPECT_EQ(c.splits.size(), 2u);
  EXPECT_FALSE(c.abort_on_incomplete);
}

TEST(EvalConfig, LoadsKeyValueFile) {
  TempDir dir;
  const auto path = dir.path() / "eval.cfg";
  {
    std::ofstream f(path);
    f << "# evaluation of the glacier model\n"
      << "base_dir = /data/patches\n"
      << "output_dir=/tmp/eval\n"
      << "\n"
      << "threshold_low=0.2\n"
      << "threshold_high = 0.8\n"
      << "threshold_steps=4\n"
      << "num_workers=3\n"
      << "splits=test\n"
      << "abort_on_incomplete=true\n"
      << "log_level=debug\n"
      << "unknown_key=ignored\n";
  }
  const auto c = sa::load_config(path.string());
  EXPECT_EQ(c.base_dir, "/data/patches");
  EXPECT_EQ(c.output_dir, "/tmp/eval");
  EXPECT_DOUBLE_EQ(c.threshold_low, 0.2);
  EXPECT_DOUBLE_EQ(c.threshold_high, 0.8);
  EXPECT_EQ(c.threshold_steps, 4u);
  EXPECT_EQ(c.num_workers, 3u);
  ASSERT_EQ(c.splits.size(), 1u);
  EXPECT_EQ(c.splits[0], sc::Split::Test);
  EXPECT_TRUE(c.abort_on_incomplete);
  EXPECT_EQ(c.log_level, "debug");
}

TEST(EvalConfig, MalformedValueKeepsDefault) {
  TempDir dir;
  const auto path = dir.path() / "bad.cfg";
  std::ofstream(path) << "threshold_steps=many\nsplits=train,validation\nthreshold_low=0.3\n";
  const auto c = sa::load_config(path.string());
  EXPECT_EQ(c.threshold_steps, 9u);
  EXPECT_EQ(c.splits.size(), 2u);
  EXPECT_DOUBLE_EQ(c.threshold_low, 0.3);
}

TEST(EvalConfig, MissingFileGivesDefaults) {
  const auto c = sa::load_config("nonexistent_segeval_config_12345.cfg");
  EXPECT_EQ(c.threshold_steps, 9u);
}

TEST(EvalConfig, ValidateBuildsSweep) {
  auto c = sa::default_config();
  c.base_dir = "data";
  auto sweep = sa::validate_config(c);
  ASSERT_TRUE(sweep.has_value());
  EXPECT_EQ(sweep->size(), 9u);

  c.threshold_high = 1.5;
  EXPECT_EQ(sa::validate_config(c).error(), sc::EvalError::InvalidConfig);

  c = sa::default_config();
  EXPECT_EQ(sa::validate_config(c).error(), sc::EvalError::InvalidConfig);  // no base_dir

  c.base_dir = "data";
  c.splits.clear();
  EXPECT_FALSE(sa::validate_config(c).has_value());
}

TEST(EvalConfig, NegativeCountsKeepDefaults) {
  TempDir dir;
  const auto path = dir.path() / "negative.cfg";
  std::ofstream(path) << "threshold_steps=-1\nnum_workers=-4\n";
  const auto c = sa::load_config(path.string());
  EXPECT_EQ(c.threshold_steps, 9u);
  EXPECT_EQ(c.num_workers, 0u);
}

TEST(EvalConfig, ParseCount) {
  EXPECT_EQ(sa::parse_count("12"), 12u);
  EXPECT_EQ(sa::parse_count("0"), 0u);
  EXPECT_THROW(sa::parse_count("-1"), std::invalid_argument);
  EXPECT_THROW(sa::parse_count("3x"), std::invalid_argument);
  EXPECT_THROW(sa::parse_count(""), std::invalid_argument);
  EXPECT_THROW(sa::parse_count("99999999999999999999999"), std::out_of_range);
}

TEST(EvalConfig, HugeStepCountIsInvalidConfig) {
  auto c = sa::default_config();
  c.base_dir = "data";
  c.threshold_steps = static_cast<std::size_t>(-1);
  EXPECT_EQ(sa::validate_config(c).error(), sc::EvalError::InvalidConfig);
}
