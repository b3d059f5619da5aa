// Ticket: 0019_bone_length_qc

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mocap-core/src/Gates/BoneLengthQc.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticSession;

namespace
{

constexpr std::size_t kFrames = 600;

// Whole body translates together, every segment keeps its rest length
MotionSession rigidCapture()
{
  Skeleton skeleton = SyntheticSession::upperBody();
  auto times = SyntheticSession::uniformTimes(120.0, kFrames);
  std::vector<JointTrack> tracks(skeleton.size());
  for (JointIndex j = 0; j < skeleton.size(); ++j)
  {
    Eigen::Vector3d const rest = SyntheticSession::restPosition(skeleton.name(j));
    auto& track = tracks[j];
    track.positions.resize(static_cast<Eigen::Index>(kFrames), 3);
    for (std::size_t i = 0; i < kFrames; ++i)
    {
      double const sway = 40.0 * std::sin(2.0 * M_PI * times[i]);
      track.positions.row(static_cast<Eigen::Index>(i)) =
        (rest + Eigen::Vector3d{sway, 0.5 * sway, 0.0}).transpose();
      track.orientations.push_back(QuaternionD{1.0, 0.0, 0.0, 0.0});
    }
  }
  return MotionSession{"rigid", std::move(skeleton), std::move(times), std::move(tracks)};
}

// Moves the left hand along -x (away from the elbow) by offset(frame) mm
template <typename Offset>
MotionSession withHandOffset(const MotionSession& session, Offset offset)
{
  auto const hand = *session.skeleton().indexOf("LeftHand");
  auto track = session.track(hand);
  for (std::size_t i = 0; i < kFrames; ++i)
  {
    track.positions(static_cast<Eigen::Index>(i), 0) -= offset(i);
  }
  return session.withTrack(hand, track);
}

const BoneLengthStats& boneOf(const BoneLengthQc::Report& report, const std::string& child)
{
  for (const auto& bone : report.bones)
  {
    if (bone.child == child)
    {
      return bone;
    }
  }
  throw std::out_of_range{"no bone ending at " + child};
}

}  // namespace

// ============================================================================
// Per-bone statistics
// ============================================================================

TEST(BoneLengthQcTest, RigidCapture_AllBonesPass)
{
  auto const report = BoneLengthQc::analyze(rigidCapture());

  // Every joint but the root has a parent
  EXPECT_EQ(report.bones.size(), 8u);
  EXPECT_EQ(report.warnCount, 0u);
  EXPECT_EQ(report.alertCount, 0u);
  EXPECT_TRUE(report.flaggedBones().empty());
  EXPECT_NEAR(boneOf(report, "LeftHand").medianLength, 270.0, 1e-6);
  EXPECT_NEAR(boneOf(report, "LeftHand").cv, 0.0, 1e-9);
}

TEST(BoneLengthQcTest, SuddenStretch_Alerts)
{
  auto const session = withHandOffset(rigidCapture(),
                                      [](std::size_t i) { return i >= 300 ? 50.0 : 0.0; });

  auto const report = BoneLengthQc::analyze(session);

  auto const& hand = boneOf(report, "LeftHand");
  EXPECT_EQ(hand.status, BoneStatus::Alert);
  EXPECT_NEAR(hand.maxJump, 50.0, 1e-6);
  EXPECT_EQ(report.alertCount, 1u);
  ASSERT_EQ(report.flaggedBones().size(), 1u);
  EXPECT_EQ(report.flaggedBones()[0], "LeftElbow->LeftHand ALERT");
  EXPECT_EQ(boneOf(report, "LeftElbow").status, BoneStatus::Pass);
}

TEST(BoneLengthQcTest, SlowCreep_Warns)
{
  auto const session = withHandOffset(
    rigidCapture(),
    [](std::size_t i) { return 30.0 * static_cast<double>(i) / kFrames; });

  auto const report = BoneLengthQc::analyze(session);

  auto const& hand = boneOf(report, "LeftHand");
  EXPECT_EQ(hand.status, BoneStatus::Warn);
  EXPECT_GT(hand.cv, 0.02);
  EXPECT_LT(hand.cv, 0.05);
  EXPECT_LT(hand.maxJump, 1.0);
  EXPECT_EQ(report.warnCount, 1u);
  EXPECT_EQ(report.alertCount, 0u);
}

TEST(BoneLengthQcTest, MissingFrames_Skipped)
{
  auto const session = rigidCapture();
  auto const hand = *session.skeleton().indexOf("LeftHand");
  auto track = session.track(hand);
  track.positions.setConstant(std::numeric_limits<double>::quiet_NaN());
  track.positions.topRows(5) = session.track(hand).positions.topRows(5);

  auto const report = BoneLengthQc::analyze(session.withTrack(hand, track));

  EXPECT_EQ(report.bones.size(), 7u);
  EXPECT_THROW((void)boneOf(report, "LeftHand"), std::out_of_range);
}

// ============================================================================
// measure()
// ============================================================================

TEST(BoneLengthQcTest, Measure_Empty_Throws)
{
  EXPECT_THROW((void)BoneLengthQc::measure({}, BoneLengthQc::Config{}),
               std::invalid_argument);
}

TEST(BoneLengthQcTest, Measure_WideSpread_WarnsOnPercentile)
{
  // Ten percent of the frames sit 15 mm long, cv stays under the warn level
  std::vector<double> lengths(1000, 1000.0);
  for (std::size_t i = 0; i < 100; ++i)
  {
    lengths[i * 10] = 1015.0;
  }
  BoneLengthQc::Config const config;

  auto const stats = BoneLengthQc::measure(lengths, config);

  EXPECT_LT(stats.cv, config.cvWarn);
  EXPECT_DOUBLE_EQ(stats.p95AbsDeviation, 15.0);
  EXPECT_EQ(stats.status, BoneStatus::Warn);
}

TEST(BoneLengthQcTest, ToString_BoneStatus)
{
  EXPECT_EQ(toString(BoneStatus::Pass), "PASS");
  EXPECT_EQ(toString(BoneStatus::Warn), "WARN");
  EXPECT_EQ(toString(BoneStatus::Alert), "ALERT");
}
