#include <segeval/core/error.hpp>
#include <segeval/core/sample.hpp>
#include <segeval/eval/mock_array_loader.hpp>
#include "tensor_test_utils.hpp"
#include <gtest/gtest.h>

namespace sc = segeval::core;
namespace se = segeval::eval;
using segeval::test::make_tensor;

TEST(MockArrayLoader, ReturnsRegisteredArray) {
  se::MockArrayLoader loader;
  loader.set_array("a.npy", make_tensor(1, 2, {{0.5f, 1.f}}));
  auto t = loader.load("a.npy");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->at(0, 0, 1), 1.f);
}

TEST(MockArrayLoader, UnknownAndFailingPathsFail) {
  se::MockArrayLoader loader;
  loader.set_array("a.npy", make_tensor(1, 1, {{0.f}}));
  loader.fail_on("a.npy");
  EXPECT_EQ(loader.load("a.npy").error(), sc::EvalError::ArtifactLoadFailed);
  EXPECT_EQ(loader.load("b.npy").error(), sc::EvalError::ArtifactLoadFailed);
}

TEST(MockArrayLoader, LoadSampleStopsAtFirstFailure) {
  se::MockArrayLoader loader;
  loader.set_array("x0", make_tensor(1, 1, {{0.f}}));
  loader.set_array("y0", make_tensor(1, 1, {{1.f}}));
  sc::SampleTriple triple{{sc::Split::Train, 0}, "x0", "y0", "y_hat0"};
  auto sample = loader.load_sample(triple);
  ASSERT_FALSE(sample.has_value());
  EXPECT_EQ(sample.error(), sc::EvalError::ArtifactLoadFailed);

  loader.set_array("y_hat0", make_tensor(1, 1, {{0.7f}}));
  auto complete = loader.load_sample(triple);
  ASSERT_TRUE(complete.has_value());
  EXPECT_EQ(complete->key, triple.key);
  EXPECT_FLOAT_EQ(complete->y_hat.at(0, 0, 0), 0.7f);
}
