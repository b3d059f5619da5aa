// Ticket: 0020_snr_analysis

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "mocap-core/src/Filtering/PositionFilter.hpp"
#include "mocap-core/src/Filtering/SnrAnalysis.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticCapture;
using mocap_core::test::SyntheticSession;

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

MotionSession scaledPositions(const MotionSession& session, JointIndex joint, double gain)
{
  auto track = session.track(joint);
  track.positions *= gain;
  return session.withTrack(joint, track);
}

}  // namespace

// ============================================================================
// fromResiduals
// ============================================================================

TEST(SnrAnalysisTest, FromResiduals_TenToOneAmplitude_Is20dB)
{
  std::vector<double> filtered(100, 10.0);
  std::vector<double> raw(100);
  for (std::size_t i = 0; i < raw.size(); ++i)
  {
    raw[i] = filtered[i] + (i % 2 == 0 ? 1.0 : -1.0);
  }

  EXPECT_NEAR(SnrAnalysis::fromResiduals(raw, filtered), 20.0, 1e-9);
}

TEST(SnrAnalysisTest, FromResiduals_NoResidual_Reports100dB)
{
  std::vector<double> const signal(50, 3.0);
  EXPECT_DOUBLE_EQ(SnrAnalysis::fromResiduals(signal, signal), 100.0);
}

TEST(SnrAnalysisTest, FromResiduals_IgnoresNanSamples)
{
  std::vector<double> filtered(40, 10.0);
  std::vector<double> raw(40);
  for (std::size_t i = 0; i < raw.size(); ++i)
  {
    raw[i] = filtered[i] + (i % 2 == 0 ? 1.0 : -1.0);
  }
  raw[5] = kNaN;
  filtered[6] = kNaN;

  EXPECT_NEAR(SnrAnalysis::fromResiduals(raw, filtered), 20.0, 1e-9);
}

TEST(SnrAnalysisTest, FromResiduals_TooFewFiniteSamples_IsNan)
{
  std::vector<double> raw(20, kNaN);
  std::vector<double> filtered(20, 1.0);
  for (std::size_t i = 0; i < 9; ++i)
  {
    raw[i] = 1.5;
  }

  EXPECT_TRUE(std::isnan(SnrAnalysis::fromResiduals(raw, filtered)));
}

TEST(SnrAnalysisTest, FromResiduals_LengthMismatch_Throws)
{
  std::vector<double> const raw(20, 1.0);
  std::vector<double> const filtered(19, 1.0);
  EXPECT_THROW((void)SnrAnalysis::fromResiduals(raw, filtered), std::invalid_argument);
}

// ============================================================================
// assess
// ============================================================================

TEST(SnrAnalysisTest, Assess_Thresholds)
{
  EXPECT_EQ(SnrAnalysis::assess(30.0), SnrQuality::Excellent);
  EXPECT_EQ(SnrAnalysis::assess(29.9), SnrQuality::Good);
  EXPECT_EQ(SnrAnalysis::assess(20.0), SnrQuality::Good);
  EXPECT_EQ(SnrAnalysis::assess(15.0), SnrQuality::Acceptable);
  EXPECT_EQ(SnrAnalysis::assess(12.0), SnrQuality::Poor);
  EXPECT_EQ(SnrAnalysis::assess(9.9), SnrQuality::Reject);
  EXPECT_EQ(SnrAnalysis::assess(kNaN), SnrQuality::Unknown);
}

// ============================================================================
// perJoint
// ============================================================================

TEST(SnrAnalysisTest, PerJoint_FilteredCapture_AllAcceptable)
{
  auto const raw = SyntheticSession::capture(SyntheticCapture{});
  auto const filtered = PositionFilter::apply(raw, 120.0, PositionFilter::Config{}).session;

  auto const report = SnrAnalysis::perJoint(raw, filtered);

  ASSERT_EQ(report.joints.size(), raw.jointCount());
  EXPECT_TRUE(report.failedJoints.empty());
  EXPECT_GE(report.minDb, 15.0);
  EXPECT_LE(report.minDb, report.meanDb);
  EXPECT_GE(report.maxDb, report.meanDb);
  EXPECT_EQ(report.overall, SnrAnalysis::assess(report.meanDb));
}

TEST(SnrAnalysisTest, PerJoint_HalvedJoint_ListedAsFailed)
{
  auto const raw = SyntheticSession::capture(SyntheticCapture{});
  auto const hand = *raw.skeleton().indexOf("RightHand");
  // Residual equals the filtered signal: 0 dB
  auto const filtered = scaledPositions(raw, hand, 0.5);

  auto const report = SnrAnalysis::perJoint(raw, filtered);

  ASSERT_EQ(report.failedJoints.size(), 1u);
  EXPECT_EQ(report.failedJoints[0], "RightHand");
  const auto& joint = report.joints[hand];
  EXPECT_NEAR(joint.meanDb, 0.0, 1e-9);
  EXPECT_EQ(joint.quality, SnrQuality::Reject);
  EXPECT_DOUBLE_EQ(report.minDb, joint.meanDb);
}

TEST(SnrAnalysisTest, PerJoint_MissingJoint_UnknownAndNotFailed)
{
  auto const raw = SyntheticSession::capture(SyntheticCapture{});
  auto const head = *raw.skeleton().indexOf("Head");
  auto track = raw.track(head);
  track.positions.setConstant(kNaN);
  auto const filtered = raw.withTrack(head, track);

  auto const report = SnrAnalysis::perJoint(raw, filtered);

  const auto& joint = report.joints[head];
  EXPECT_TRUE(std::isnan(joint.meanDb));
  EXPECT_EQ(joint.quality, SnrQuality::Unknown);
  EXPECT_TRUE(report.failedJoints.empty());
  EXPECT_TRUE(std::isfinite(report.meanDb));
}

TEST(SnrAnalysisTest, PerJoint_ShapeMismatch_Throws)
{
  auto const raw = SyntheticSession::capture(SyntheticCapture{});
  SyntheticCapture shorter;
  shorter.movingSeconds = 2.0;
  auto const filtered = SyntheticSession::capture(shorter);

  EXPECT_THROW((void)SnrAnalysis::perJoint(raw, filtered), std::invalid_argument);
}
