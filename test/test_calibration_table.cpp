#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "CalibrationTable.hpp"

namespace flywheel {
namespace {

TEST(CalibrationTableTest, LoadsStrictlyIncreasingTable) {
  CalibrationTable table;
  ASSERT_EQ(table.Load({{0.0f, 0.0f, 5000.0f},
                        {7.0f, 880.0f, 5000.0f},
                        {8.0f, 1120.0f, 5000.0f}}),
            ErrorCode::OK);
  EXPECT_EQ(table.Size(), 3u);
  EXPECT_FLOAT_EQ(table.MinDistance(), 0.0f);
  EXPECT_FLOAT_EQ(table.MaxDistance(), 8.0f);
  EXPECT_FLOAT_EQ(table[1].centre_rps, 880.0f);
}

TEST(CalibrationTableTest, RejectsSingleSample) {
  CalibrationTable table;
  EXPECT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}}), ErrorCode::SIZE_ERR);
  EXPECT_TRUE(table.Empty());
}

TEST(CalibrationTableTest, RejectsNullSamples) {
  CalibrationTable table;
  EXPECT_EQ(table.Load(nullptr, 4), ErrorCode::SIZE_ERR);
  EXPECT_TRUE(table.Empty());
}

TEST(CalibrationTableTest, RejectsNonIncreasingDistances) {
  CalibrationTable table;
  EXPECT_EQ(table.Load({{7.0f, 880.0f, 5000.0f},
                        {9.0f, 1500.0f, 5000.0f},
                        {8.0f, 1120.0f, 5000.0f}}),
            ErrorCode::ARG_ERR);
  EXPECT_TRUE(table.Empty());

  EXPECT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}, {7.0f, 900.0f, 5000.0f}}),
            ErrorCode::ARG_ERR);
  EXPECT_TRUE(table.Empty());
}

TEST(CalibrationTableTest, RejectsNegativeVelocity) {
  CalibrationTable table;
  EXPECT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}, {8.0f, -1.0f, 5000.0f}}),
            ErrorCode::ARG_ERR);
  EXPECT_EQ(table.Load({{7.0f, 880.0f, -5000.0f}, {8.0f, 1120.0f, 5000.0f}}),
            ErrorCode::ARG_ERR);
}

TEST(CalibrationTableTest, RejectsNonFiniteValues) {
  const float NAN_VALUE = std::numeric_limits<float>::quiet_NaN();
  const float INF_VALUE = std::numeric_limits<float>::infinity();
  CalibrationTable table;
  EXPECT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}, {NAN_VALUE, 1120.0f, 5000.0f}}),
            ErrorCode::ARG_ERR);
  EXPECT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}, {8.0f, INF_VALUE, 5000.0f}}),
            ErrorCode::ARG_ERR);
}

TEST(CalibrationTableTest, FailedReloadClearsPreviousData) {
  CalibrationTable table;
  ASSERT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}, {8.0f, 1120.0f, 5000.0f}}),
            ErrorCode::OK);
  EXPECT_EQ(table.Load({{8.0f, 880.0f, 5000.0f}, {7.0f, 1120.0f, 5000.0f}}),
            ErrorCode::ARG_ERR);
  EXPECT_TRUE(table.Empty());
}

TEST(CalibrationTableTest, InterpolatesBetweenSamples) {
  CalibrationTable table;
  ASSERT_EQ(table.Load({{7.0f, 880.0f, 4000.0f}, {8.0f, 1120.0f, 5000.0f}}),
            ErrorCode::OK);

  CalibrationSample sample = table.Interpolate(7.5f);
  EXPECT_FLOAT_EQ(sample.distance, 7.5f);
  EXPECT_FLOAT_EQ(sample.centre_rps, 1000.0f);
  EXPECT_FLOAT_EQ(sample.outer_rps, 4500.0f);

  sample = table.Interpolate(7.25f);
  EXPECT_FLOAT_EQ(sample.centre_rps, 940.0f);
  EXPECT_FLOAT_EQ(sample.outer_rps, 4250.0f);
}

TEST(CalibrationTableTest, InteriorSampleIsReturnedExactly) {
  CalibrationTable table;
  ASSERT_EQ(table.Load({{7.0f, 880.0f, 5000.0f},
                        {8.0f, 1120.0f, 5000.0f},
                        {9.0f, 1500.0f, 5000.0f}}),
            ErrorCode::OK);
  EXPECT_FLOAT_EQ(table.Interpolate(8.0f).centre_rps, 1120.0f);
}

TEST(CalibrationTableTest, HoldsBoundaryValuesOutsideTable) {
  CalibrationTable table;
  ASSERT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}, {8.0f, 1120.0f, 4000.0f}}),
            ErrorCode::OK);

  EXPECT_FLOAT_EQ(table.Interpolate(3.0f).centre_rps, 880.0f);
  EXPECT_FLOAT_EQ(table.Interpolate(3.0f).outer_rps, 5000.0f);
  EXPECT_FLOAT_EQ(table.Interpolate(30.0f).centre_rps, 1120.0f);
  EXPECT_FLOAT_EQ(table.Interpolate(30.0f).outer_rps, 4000.0f);
}

TEST(CalibrationTableTest, EmptyTableAccessorsReturnZero) {
  CalibrationTable table;
  EXPECT_FLOAT_EQ(table.MinDistance(), 0.0f);
  EXPECT_FLOAT_EQ(table.MaxDistance(), 0.0f);

  CalibrationSample sample = table.Interpolate(7.5f);
  EXPECT_FLOAT_EQ(sample.distance, 0.0f);
  EXPECT_FLOAT_EQ(sample.centre_rps, 0.0f);
  EXPECT_FLOAT_EQ(sample.outer_rps, 0.0f);
}

TEST(CalibrationTableTest, RejectedLoadLeavesSafeEmptyTable) {
  CalibrationTable table;
  ASSERT_EQ(table.Load({{7.0f, 880.0f, 5000.0f}, {8.0f, 1120.0f, 4000.0f}}),
            ErrorCode::OK);
  ASSERT_EQ(table.Load({{8.0f, 880.0f, 5000.0f}, {7.0f, 1120.0f, 4000.0f}}),
            ErrorCode::ARG_ERR);

  EXPECT_TRUE(table.Empty());
  EXPECT_FLOAT_EQ(table.Interpolate(7.5f).centre_rps, 0.0f);
  EXPECT_FLOAT_EQ(table.MaxDistance(), 0.0f);
}

}  // namespace
}  // namespace flywheel
