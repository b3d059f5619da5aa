// Ticket: 0011_anatomical_calibration

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "mocap-core/src/Calibration/ReferenceWindowDetector.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticCapture;
using mocap_core::test::SyntheticSession;

TEST(ReferenceWindowDetectorTest, StaticStart_FoundByCriteria)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const result =
    ReferenceWindowDetector::detect(session, ReferenceWindowDetector::Config{});

  ASSERT_TRUE(result.isSuccess());
  const auto& window = result.value();
  EXPECT_EQ(window.method, "criteria");
  EXPECT_FALSE(window.isFallback);
  EXPECT_LE(window.endTime, 2.0 + 1e-6);
  EXPECT_NEAR(window.meanMotion, 0.0, 1e-6);
  EXPECT_EQ(window.size(), 120u);
}

TEST(ReferenceWindowDetectorTest, ReferenceJoints_Reported)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const result =
    ReferenceWindowDetector::detect(session, ReferenceWindowDetector::Config{});

  ASSERT_TRUE(result.hasValue());
  // RightHand, LeftHand and Hips all exist in the upper body skeleton
  EXPECT_EQ(result.value().referenceJoints.size(), 3u);
}

TEST(ReferenceWindowDetectorTest, ContinuousMotion_FallsBackToMinimumMotion)
{
  SyntheticCapture settings;
  settings.staticSeconds = 0.0;
  settings.movingSeconds = 5.0;
  auto const session = SyntheticSession::capture(settings);

  auto const result =
    ReferenceWindowDetector::detect(session, ReferenceWindowDetector::Config{});

  ASSERT_TRUE(result.isDegraded());
  EXPECT_EQ(result.value().method, "fallback_min_motion");
  EXPECT_TRUE(result.value().isFallback);
  EXPECT_GT(result.value().meanMotion, 0.30);
}

TEST(ReferenceWindowDetectorTest, MotionProfile_ZeroWhileStatic)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const motion = ReferenceWindowDetector::motionProfile(session);

  ASSERT_EQ(motion.size(), session.frameCount() - 1);
  EXPECT_NEAR(motion[10], 0.0, 1e-9);
  // Peak rotation speed of the moving phase is 0.5 * 2 pi rad/s
  EXPECT_GT(motion[300], 0.5);
}

TEST(ReferenceWindowDetectorTest, NonPositiveWindow_Throws)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});
  ReferenceWindowDetector::Config config;
  config.windowSeconds = 0.0;

  EXPECT_THROW((void)ReferenceWindowDetector::detect(session, config),
               std::invalid_argument);
}
