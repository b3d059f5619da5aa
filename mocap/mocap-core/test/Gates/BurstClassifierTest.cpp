// Ticket: 0015_burst_classification

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "mocap-core/src/Gates/BurstClassifier.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;

namespace
{

constexpr double kFs = 120.0;

// Single-joint |omega| trace with a constant base and one high-speed run
Eigen::MatrixXd trace(std::size_t frames,
                      double base,
                      std::size_t runStart,
                      std::size_t runLength,
                      double runSpeed)
{
  Eigen::MatrixXd m = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(frames), 1, base);
  m.block(static_cast<Eigen::Index>(runStart), 0, static_cast<Eigen::Index>(runLength), 1)
    .setConstant(runSpeed);
  return m;
}

const std::vector<std::string> kJoint{"RightHand"};

}  // namespace

// ============================================================================
// Tier boundaries
// ============================================================================

TEST(BurstClassifierTest, TierFor_Boundaries)
{
  BurstClassifier::Config const config;
  EXPECT_EQ(BurstClassifier::tierFor(0, config), BurstTier::Normal);
  EXPECT_EQ(BurstClassifier::tierFor(1, config), BurstTier::Artifact);
  EXPECT_EQ(BurstClassifier::tierFor(3, config), BurstTier::Artifact);
  EXPECT_EQ(BurstClassifier::tierFor(4, config), BurstTier::Burst);
  EXPECT_EQ(BurstClassifier::tierFor(7, config), BurstTier::Burst);
  EXPECT_EQ(BurstClassifier::tierFor(8, config), BurstTier::Flow);
}

TEST(BurstClassifierTest, SevenFrames_Burst_EightFrames_Flow)
{
  auto const burst = BurstClassifier::classify(trace(600, 100.0, 300, 7, 2500.0), kJoint, kFs);
  auto const flow = BurstClassifier::classify(trace(600, 100.0, 300, 8, 2500.0), kJoint, kFs);

  EXPECT_EQ(burst.burstCount, 1u);
  EXPECT_EQ(burst.flowCount, 0u);
  EXPECT_EQ(burst.verdict.status, GateStatus::Review);
  EXPECT_EQ(burst.events[0].action, "INCLUDE_FLAGGED");

  EXPECT_EQ(flow.flowCount, 1u);
  EXPECT_EQ(flow.burstCount, 0u);
  EXPECT_EQ(flow.verdict.status, GateStatus::AcceptHighIntensity);
  EXPECT_EQ(flow.events[0].action, "INCLUDE");
  EXPECT_TRUE(flow.framesToReview.empty());
}

// ============================================================================
// Artifacts
// ============================================================================

TEST(BurstClassifierTest, TwoFrameSpike_SingleArtifact)
{
  auto const result = BurstClassifier::classify(trace(600, 100.0, 300, 2, 3000.0), kJoint, kFs);

  EXPECT_EQ(result.artifactCount, 1u);
  EXPECT_EQ(result.burstCount, 0u);
  EXPECT_EQ(result.flowCount, 0u);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].durationFrames, 2u);
  EXPECT_NEAR(result.events[0].durationMs, 2000.0 / kFs, 1e-9);
  EXPECT_EQ(result.events[0].action, "EXCLUDE");
  EXPECT_EQ(result.framesToExclude, (std::vector<std::size_t>{300, 301}));
  EXPECT_EQ(result.statusMask(300, 0), static_cast<int>(BurstTier::Artifact));
  EXPECT_EQ(result.statusMask(302, 0), static_cast<int>(BurstTier::Normal));
  EXPECT_EQ(result.verdict.status, GateStatus::Review);
  EXPECT_EQ(result.verdict.reason.rfind("REVIEW: High-Speed Artifact", 0), 0u);
}

TEST(BurstClassifierTest, CleanStatistics_ExcludeArtifactFrames)
{
  auto const result =
    BurstClassifier::classify(trace(1000, 500.0, 100, 2, 5000.0), kJoint, kFs);

  EXPECT_DOUBLE_EQ(result.statistics.raw.max, 5000.0);
  EXPECT_LT(result.statistics.clean.max, 1000.0);
  EXPECT_EQ(result.statistics.excludedFrames, 2u);
  EXPECT_NEAR(result.statistics.dataRetainedPercent, 99.8, 1e-9);
  EXPECT_DOUBLE_EQ(result.statistics.perJointClean.at("RightHand").max, 500.0);
}

// ============================================================================
// Verdicts
// ============================================================================

TEST(BurstClassifierTest, BelowTrigger_Pass)
{
  Eigen::MatrixXd const m = Eigen::MatrixXd::Constant(600, 2, 400.0);

  auto const result = BurstClassifier::classify(m, {"Hips", "Head"}, kFs);

  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(result.verdict.status, GateStatus::Pass);
  EXPECT_EQ(result.density.level, DensityLevel::Acceptable);
  EXPECT_EQ(result.verdict.gate, 5);
}

TEST(BurstClassifierTest, ExtremeSustainedFlow_Review)
{
  auto const result =
    BurstClassifier::classify(trace(600, 100.0, 200, 10, 6000.0), kJoint, kFs);

  EXPECT_EQ(result.flowCount, 1u);
  EXPECT_EQ(result.verdict.status, GateStatus::Review);
  EXPECT_EQ(result.framesToReview.size(), 10u);
  EXPECT_EQ(result.verdict.reason.rfind("REVIEW: Extreme Sustained Velocity", 0), 0u);
}

TEST(BurstClassifierTest, ManyArtifacts_DensityRejects)
{
  Eigen::MatrixXd m = Eigen::MatrixXd::Constant(6000, 1, 100.0);
  for (Eigen::Index start = 50; start < 6000; start += 100)
  {
    m.block(start, 0, 2, 1).setConstant(3000.0);
  }

  auto const result = BurstClassifier::classify(m, kJoint, kFs);

  EXPECT_EQ(result.artifactCount, 60u);
  EXPECT_EQ(result.density.level, DensityLevel::Excessive);
  EXPECT_EQ(result.verdict.status, GateStatus::Reject);
  EXPECT_EQ(result.verdict.reason.rfind("REJECT:", 0), 0u);
}

TEST(BurstClassifierTest, NameCountMismatch_Throws)
{
  Eigen::MatrixXd const m = Eigen::MatrixXd::Zero(10, 2);
  EXPECT_THROW((void)BurstClassifier::classify(m, kJoint, kFs), std::invalid_argument);
}

TEST(BurstClassifierTest, SyntheticKinematics_Pass)
{
  using mocap_core::test::SyntheticCapture;
  using mocap_core::test::SyntheticSession;

  auto const session = SyntheticSession::capture(SyntheticCapture{});
  ReferenceWindow window;
  window.endFrame = 120;
  auto const k = KinematicsEngine::compute(session, window, 120.0);

  auto const result = BurstClassifier::classify(k, BurstClassifier::Config{});

  EXPECT_EQ(result.statusMask.rows(), static_cast<Eigen::Index>(session.frameCount()));
  EXPECT_EQ(result.statusMask.cols(), static_cast<Eigen::Index>(session.jointCount()));
  EXPECT_EQ(result.verdict.status, GateStatus::Pass);
}
