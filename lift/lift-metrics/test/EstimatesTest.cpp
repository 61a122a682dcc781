// Ticket: 0003_set_estimates
// Test: one-rep-max estimate and set completeness

#include <gtest/gtest.h>

#include "lift-metrics/src/Estimates.hpp"

namespace lift_metrics
{
namespace test
{

// ========== estimateOneRepMax Tests ==========

TEST(EstimatesTest, SingleRep_ReturnsWeight)
{
  EXPECT_DOUBLE_EQ(estimateOneRepMax(140.0, 1).value(), 140.0);
}

TEST(EstimatesTest, Epley_FiveReps)
{
  // 100 * (1 + 5/30)
  EXPECT_NEAR(estimateOneRepMax(100.0, 5).value(), 116.6667, 1e-4);
}

TEST(EstimatesTest, Epley_TenRepsIsUpperBound)
{
  EXPECT_NEAR(estimateOneRepMax(60.0, 10).value(), 80.0, 1e-9);
  EXPECT_FALSE(estimateOneRepMax(60.0, 11).has_value());
}

TEST(EstimatesTest, InvalidInputs_ReturnNullopt)
{
  EXPECT_FALSE(estimateOneRepMax(100.0, 0).has_value());
  EXPECT_FALSE(estimateOneRepMax(0.0, 5).has_value());
  EXPECT_FALSE(estimateOneRepMax(-20.0, 3).has_value());
}

TEST(EstimatesTest, FromMeasurements_RequiresWeightAndReps)
{
  Measurements m;
  m.weight = 100.0;
  EXPECT_FALSE(estimateOneRepMax(m).has_value());

  m.reps = 3;
  EXPECT_NEAR(estimateOneRepMax(m).value(), 110.0, 1e-9);
}

// ========== isCompleteSet Tests ==========

TEST(EstimatesTest, IsCompleteSet_AllRequiredPositive)
{
  Measurements m;
  m.distance = 5.0;
  m.time = 1500;

  EXPECT_TRUE(isCompleteSet(ExerciseType::DistanceTime, m));
  EXPECT_TRUE(isCompleteSet(ExerciseType::Distance, m));
  EXPECT_FALSE(isCompleteSet(ExerciseType::WeightReps, m));
}

TEST(EstimatesTest, IsCompleteSet_ZeroIsIncomplete)
{
  Measurements m;
  m.weight = 0.0;
  m.reps = 10;

  EXPECT_FALSE(isCompleteSet(ExerciseType::WeightReps, m));
  EXPECT_TRUE(isCompleteSet(ExerciseType::Reps, m));
}

}  // namespace test
}  // namespace lift_metrics
