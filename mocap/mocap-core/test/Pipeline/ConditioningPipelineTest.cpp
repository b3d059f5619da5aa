// Ticket: 0016_conditioning_pipeline

#include <gtest/gtest.h>

#include <algorithm>
#include <numbers>
#include <string>

#include "mocap-core/src/Pipeline/ConditioningPipeline.hpp"
#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticCapture;
using mocap_core::test::SyntheticSession;

namespace
{

MotionSession withHandFlip(const MotionSession& session, std::size_t frame)
{
  auto const hand = *session.skeleton().indexOf("RightHand");
  auto track = session.track(hand);
  track.orientations[frame] = QuaternionOps::compose(
    track.orientations[frame],
    QuaternionOps::fromRotationVector(Eigen::Vector3d::UnitZ() *
                                      (30.0 * std::numbers::pi / 180.0)));
  return session.withTrack(hand, track);
}

}  // namespace

// ============================================================================
// End to end
// ============================================================================

TEST(ConditioningPipelineTest, CleanCapture_AllGatesEvaluated)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const result = ConditioningPipeline::run(session);

  ASSERT_EQ(result.verdict.gates.size(), 5u);
  for (std::size_t i = 0; i < result.verdict.gates.size(); ++i)
  {
    EXPECT_EQ(result.verdict.gates[i].gate, static_cast<int>(i) + 1);
  }
  EXPECT_NE(result.verdict.status, GateStatus::Reject);

  EXPECT_EQ(result.verdict.gates[0].status, GateStatus::Pass);
  EXPECT_EQ(result.verdict.gates[1].status, GateStatus::Pass);
  EXPECT_EQ(result.verdict.gates[3].status, GateStatus::Pass);
  EXPECT_EQ(result.verdict.gates[4].status, GateStatus::Pass);
}

TEST(ConditioningPipelineTest, CleanCapture_AdvisoryReportsAttached)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const result = ConditioningPipeline::run(session);

  EXPECT_EQ(result.snr.joints.size(), session.jointCount());
  EXPECT_EQ(result.bones.bones.size(), session.jointCount() - 1);
  const auto& filtering = result.verdict.gates[2];
  EXPECT_EQ(filtering.metrics.count("snr_mean_db"), 1u);
  EXPECT_EQ(filtering.metrics.count("snr_joints_below_min"), 1u);
  const auto& compliance = result.verdict.gates[3];
  EXPECT_EQ(compliance.metrics.count("bones_checked"), 1u);
  EXPECT_EQ(compliance.metrics.count("max_norm_error_before"), 1u);
  EXPECT_EQ(compliance.metrics.count("max_norm_error_after"), 1u);
}

// ============================================================================
// Degradations reaching the verdict
// ============================================================================

TEST(ConditioningPipelineTest, NoStaticPose_CalibrationGateReviews)
{
  SyntheticCapture settings;
  settings.staticSeconds = 0.0;
  settings.movingSeconds = 8.0;
  settings.rotationAmplitudeRad = 1.0;
  auto const session = SyntheticSession::capture(settings);

  auto const result = ConditioningPipeline::run(session);

  ASSERT_TRUE(result.calibrationDegraded);
  const auto& calibration = result.verdict.gates[0];
  EXPECT_EQ(calibration.gate, 1);
  EXPECT_EQ(calibration.status, GateStatus::Review);
  EXPECT_NE(calibration.reason.find(result.calibrationReason), std::string::npos);
  EXPECT_NE(result.verdict.status, GateStatus::Pass);

  bool const reported = std::any_of(
    result.verdict.reasons.begin(),
    result.verdict.reasons.end(),
    [](const std::string& r)
    { return r.rfind("Gate 1: REVIEW: Calibration Degraded", 0) == 0; });
  EXPECT_TRUE(reported);
}

TEST(ConditioningPipelineTest, SourceNormDrift_ReviewedByGate4)
{
  auto const clean = SyntheticSession::capture(SyntheticCapture{});
  auto const hand = *clean.skeleton().indexOf("RightHand");
  auto track = clean.track(hand);
  for (auto& q : track.orientations)
  {
    q.eigen().coeffs() *= 1.03;
  }
  auto const session = clean.withTrack(hand, track);

  auto const result = ConditioningPipeline::run(session);

  const auto& compliance = result.verdict.gates[3];
  EXPECT_EQ(compliance.gate, 4);
  EXPECT_EQ(compliance.status, GateStatus::Review);
  EXPECT_NEAR(compliance.metrics.at("max_norm_error_before"), 0.03, 1e-9);
  EXPECT_LT(compliance.metrics.at("max_norm_error_after"), 1e-9);
  EXPECT_NEAR(result.maxNormErrorBefore, 0.03, 1e-9);
  EXPECT_LT(result.maxNormErrorAfter, 1e-9);
}

TEST(ConditioningPipelineTest, CleanCapture_StagesProduceConsistentShapes)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const result = ConditioningPipeline::run(session);

  EXPECT_EQ(result.runId, "synthetic");
  EXPECT_DOUBLE_EQ(result.samplingRate, 120.0);
  EXPECT_EQ(result.conditioned.frameCount(), session.frameCount());
  EXPECT_EQ(result.kinematics.joints.size(), session.jointCount());
  EXPECT_EQ(result.bursts.statusMask.rows(),
            static_cast<Eigen::Index>(result.conditioned.frameCount()));
  EXPECT_EQ(result.calibration.offsets.size(), session.jointCount());
  EXPECT_FALSE(result.calibrationDegraded);
  EXPECT_LT(result.maxNormErrorAfter, 0.01);
  EXPECT_GT(result.filter.cutoffHz, 0.0);
}

TEST(ConditioningPipelineTest, TransientFlip_ReportedThenRepaired)
{
  auto const session =
    withHandFlip(SyntheticSession::capture(SyntheticCapture{}), 500);

  auto const result = ConditioningPipeline::run(session);

  // Gate 5 sees the kinematics before repair
  EXPECT_EQ(result.bursts.artifactCount, 1u);
  EXPECT_EQ(result.verdict.gates[4].status, GateStatus::Review);
  ASSERT_FALSE(result.repairs.empty());
  EXPECT_EQ(result.repairs[0].jointName, "RightHand");
  EXPECT_FALSE(result.verdict.reasons.empty());
}

TEST(ConditioningPipelineTest, SurgicalRepairDisabled_KeepsTransient)
{
  auto const session =
    withHandFlip(SyntheticSession::capture(SyntheticCapture{}), 500);
  PipelineConfig config;
  config.surgicalRepair = false;

  auto const result = ConditioningPipeline::run(session, config);

  EXPECT_TRUE(result.repairs.empty());
  auto const hand = *result.kinematics.indexOf("RightHand");
  EXPECT_GT(KinematicsEngine::maxRowNorm(result.kinematics.joints[hand].angularVelocityDeg),
            2000.0);
}

TEST(ConditioningPipelineTest, FixedFilterMode_PassedThrough)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});
  PipelineConfig config;
  config.filter.mode = FilterMode::Fixed;
  config.filter.fixedCutoffHz = 6.0;

  auto const result = ConditioningPipeline::run(session, config);

  EXPECT_DOUBLE_EQ(result.filter.cutoffHz, 6.0);
  EXPECT_EQ(result.verdict.gates[2].status, GateStatus::Pass);
}
