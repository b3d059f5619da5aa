// Ticket: 0007_gap_filling

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Resampling/GapFiller.hpp"

using namespace mocap_core;

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// One joint at 100 Hz moving 1 mm per frame on every axis, rotating about z
MotionSession rampSession(std::size_t n)
{
  Skeleton skeleton{{"Hips"}, {Skeleton::kNoParent}};
  std::vector<double> times;
  JointTrack track;
  track.positions.resize(static_cast<Eigen::Index>(n), 3);
  for (std::size_t i = 0; i < n; ++i)
  {
    times.push_back(static_cast<double>(i) / 100.0);
    track.positions.row(static_cast<Eigen::Index>(i)).setConstant(static_cast<double>(i));
    track.orientations.push_back(QuaternionOps::fromRotationVector(
      Eigen::Vector3d{0.0, 0.0, 0.01 * static_cast<double>(i)}));
  }
  return MotionSession{"gaps", skeleton, times, {track}};
}

MotionSession withPositionGap(const MotionSession& session, std::size_t first, std::size_t last)
{
  JointTrack track = session.track(0);
  for (std::size_t i = first; i <= last; ++i)
  {
    track.positions.row(static_cast<Eigen::Index>(i)).setConstant(kNaN);
  }
  return session.withTrack(0, track);
}

}  // namespace

TEST(GapFillerTest, ShortInteriorGap_IsFilledWithMonotoneCubic)
{
  auto const session = withPositionGap(rampSession(100), 40, 44);

  auto const result = GapFiller::fill(session, GapFiller::Config{});

  EXPECT_EQ(result.framesFilled, 5u);
  EXPECT_EQ(result.gapsLeftOpen, 0u);
  EXPECT_NEAR(result.session.pose(0, 42).position.x(), 42.0, 1e-9);
  ASSERT_EQ(result.log.events().size(), 1u);
  EXPECT_EQ(result.log.events()[0].methodUsed, InterpolationMethod::MonotoneCubic);
  EXPECT_FALSE(result.log.events()[0].isFallback());
}

TEST(GapFillerTest, GapAboveCeiling_StaysOpenAndIsLogged)
{
  // 20 missing frames: neighbours 0.21 s apart, ceiling 0.1 s
  auto const session = withPositionGap(rampSession(100), 60, 79);

  auto const result = GapFiller::fill(session, GapFiller::Config{});

  EXPECT_EQ(result.gapsLeftOpen, 1u);
  EXPECT_TRUE(std::isnan(result.session.pose(0, 70).position.x()));
  ASSERT_EQ(result.log.events().size(), 1u);
  EXPECT_EQ(result.log.events()[0].methodUsed, InterpolationMethod::None);
  EXPECT_FALSE(result.log.events()[0].reason.empty());
}

TEST(GapFillerTest, BoundaryGap_IsNeverFilled)
{
  auto const session = withPositionGap(rampSession(100), 0, 1);

  auto const result = GapFiller::fill(session, GapFiller::Config{});

  EXPECT_EQ(result.gapsLeftOpen, 1u);
  EXPECT_TRUE(std::isnan(result.session.pose(0, 0).position.y()));
}

TEST(GapFillerTest, TooFewValidSamples_FallsBackToLinear)
{
  // Valid frames 0, 1 and 3 only
  auto session = withPositionGap(rampSession(6), 4, 5);
  session = withPositionGap(session, 2, 2);

  auto const result = GapFiller::fill(session, GapFiller::Config{});

  auto const fallbacks = result.log.fallbackEvents();
  ASSERT_EQ(fallbacks.size(), 2u);  // linear fill plus the open boundary gap
  EXPECT_NEAR(result.session.pose(0, 2).position.z(), 2.0, 1e-12);
}

TEST(GapFillerTest, OrientationGap_IsSlerpedAndNormalized)
{
  auto const source = rampSession(100);
  JointTrack track = source.track(0);
  for (std::size_t i = 20; i <= 25; ++i)
  {
    track.orientations[i] = QuaternionD::missing();
  }
  auto const session = source.withTrack(0, track);

  auto const result = GapFiller::fill(session, GapFiller::Config{});

  auto const q = result.session.pose(0, 22).orientation;
  EXPECT_NEAR(q.norm(), 1.0, 1e-12);
  EXPECT_NEAR(QuaternionOps::toRotationVector(q).z(), 0.22, 1e-9);
  ASSERT_EQ(result.log.events().size(), 1u);
  EXPECT_EQ(result.log.events()[0].channel, "orientation");
  EXPECT_EQ(result.log.events()[0].methodUsed, InterpolationMethod::Slerp);
}
