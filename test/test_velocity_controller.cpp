#include <gtest/gtest.h>

#include <limits>

#include "LauncherParam.hpp"
#include "VelocityController.hpp"

namespace flywheel {
namespace {

constexpr FeedforwardModel CENTRE_MODEL{.static_voltage = 0.158f,
                                        .velocity_gain = 0.11f};

TEST(VelocityControllerTest, PassesSetpointThrough) {
  VelocityController controller(CENTRE_MODEL);
  VelocityCommand cmd = controller.Update(1000.0f, 950.0f, 12.0f);
  EXPECT_FLOAT_EQ(cmd.setpoint_rps, 1000.0f);
}

TEST(VelocityControllerTest, FeedforwardIsNormalizedBySupplyVoltage) {
  VelocityController controller(CENTRE_MODEL);
  VelocityCommand cmd = controller.Update(100.0f, 0.0f, 12.0f);
  EXPECT_FLOAT_EQ(cmd.feedforward, (0.158f + 0.11f * 100.0f) / 12.0f);
}

TEST(VelocityControllerTest, DoublingVoltageHalvesFeedforward) {
  VelocityController controller(CENTRE_MODEL);
  float at_12v = controller.Feedforward(880.0f, 12.0f);
  float at_24v = controller.Feedforward(880.0f, 24.0f);
  EXPECT_FLOAT_EQ(at_24v, at_12v / 2.0f);
}

TEST(VelocityControllerTest, FeedforwardIsRepeatable) {
  VelocityController controller(CENTRE_MODEL);
  EXPECT_EQ(controller.Feedforward(1500.0f, 11.7f),
            controller.Feedforward(1500.0f, 11.7f));
}

TEST(VelocityControllerTest, ZeroTargetGivesZeroFeedforward) {
  VelocityController controller(CENTRE_MODEL);
  EXPECT_EQ(controller.Feedforward(0.0f, 12.0f), 0.0f);
}

TEST(VelocityControllerTest, NegativeTargetUsesNegativeStaticTerm) {
  VelocityController controller(CENTRE_MODEL);
  EXPECT_FLOAT_EQ(controller.Feedforward(-50.0f, 10.0f),
                  (-0.158f + 0.11f * -50.0f) / 10.0f);
}

TEST(VelocityControllerTest, InvalidVoltageGivesZeroFeedforward) {
  VelocityController controller(CENTRE_MODEL);
  EXPECT_EQ(controller.Feedforward(1000.0f, 0.0f), 0.0f);
  EXPECT_EQ(controller.Feedforward(1000.0f, -0.0f), 0.0f);
  EXPECT_EQ(controller.Feedforward(
                1000.0f, std::numeric_limits<float>::quiet_NaN()),
            0.0f);
  EXPECT_EQ(controller.Feedforward(1000.0f,
                                   std::numeric_limits<float>::infinity()),
            0.0f);
}

TEST(VelocityControllerTest, AtSpeedWithinTolerance) {
  EXPECT_TRUE(VelocityController::IsAtSpeed(100.0f, 100.0f));
  EXPECT_TRUE(VelocityController::IsAtSpeed(100.0f, 97.0f));
  EXPECT_TRUE(VelocityController::IsAtSpeed(100.0f, 103.0f));
  EXPECT_FALSE(VelocityController::IsAtSpeed(100.0f, 94.0f));
  EXPECT_FALSE(VelocityController::IsAtSpeed(100.0f, 106.0f));
}

TEST(VelocityControllerTest, AtSpeedAcceptsExactBoundary) {
  EXPECT_TRUE(VelocityController::IsAtSpeed(100.0f, 95.0f));
  EXPECT_TRUE(VelocityController::IsAtSpeed(100.0f, 105.0f));
}

TEST(VelocityControllerTest, AtSpeedUsesTargetMagnitude) {
  EXPECT_TRUE(VelocityController::IsAtSpeed(-100.0f, -96.0f));
  EXPECT_FALSE(VelocityController::IsAtSpeed(-100.0f, 96.0f));
}

TEST(VelocityControllerTest, AtSpeedWithZeroTargetNeedsStandstill) {
  EXPECT_TRUE(VelocityController::IsAtSpeed(0.0f, 0.0f));
  EXPECT_FALSE(VelocityController::IsAtSpeed(0.0f, 1.0f));
}

TEST(VelocityControllerTest, AtSpeedCustomTolerance) {
  EXPECT_TRUE(VelocityController::IsAtSpeed(100.0f, 90.0f, 0.1f));
  EXPECT_FALSE(VelocityController::IsAtSpeed(100.0f, 90.0f, 0.05f));
}

TEST(VelocityScaleTest, ConvertsTalonUnits) {
  EXPECT_FLOAT_EQ(TALON_FX_SCALE.FromRps(1.0f), 204.8f);
  EXPECT_FLOAT_EQ(TALON_FX_SCALE.ToRps(204.8f), 1.0f);
  EXPECT_FLOAT_EQ(TALON_FX_SCALE.ToRps(2048.0f), 10.0f);
}

TEST(VelocityScaleTest, ConvertsRpm) {
  EXPECT_FLOAT_EQ(RPM_SCALE.ToRps(6000.0f), 100.0f);
  EXPECT_FLOAT_EQ(RPM_SCALE.FromRps(100.0f), 6000.0f);
}

}  // namespace
}  // namespace flywheel
