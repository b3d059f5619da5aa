// Ticket: 0011_anatomical_calibration

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "mocap-core/src/Calibration/CalibrationEngine.hpp"
#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticCapture;
using mocap_core::test::SyntheticSession;

// ============================================================================
// Markley mean
// ============================================================================

TEST(CalibrationEngineTest, MarkleyMean_SymmetricSamples_Identity)
{
  std::vector<QuaternionD> const samples{
    QuaternionOps::fromRotationVector(Eigen::Vector3d{0.0, 0.0, 0.2}),
    QuaternionOps::fromRotationVector(Eigen::Vector3d{0.0, 0.0, -0.2})};

  auto const mean = CalibrationEngine::markleyMean(samples);

  EXPECT_NEAR(QuaternionOps::angle(mean), 0.0, 1e-9);
  EXPECT_GE(mean.w(), 0.0);
}

TEST(CalibrationEngineTest, MarkleyMean_SignFlippedSamples_Agree)
{
  auto const q = QuaternionOps::fromRotationVector(Eigen::Vector3d{0.3, 0.1, 0.0});
  std::vector<QuaternionD> const samples{q, q.negated(), q};

  auto const mean = CalibrationEngine::markleyMean(samples);

  EXPECT_NEAR(QuaternionOps::angleBetween(mean, q), 0.0, 1e-9);
}

TEST(CalibrationEngineTest, MarkleyMean_Empty_Throws)
{
  std::vector<QuaternionD> const samples;
  EXPECT_THROW((void)CalibrationEngine::markleyMean(samples),
               std::invalid_argument);
}

// ============================================================================
// Offsets
// ============================================================================

TEST(CalibrationEngineTest, ApplyOffset_NanSampleStaysMissing)
{
  double const nan = std::numeric_limits<double>::quiet_NaN();
  auto const q = QuaternionOps::fromRotationVector(Eigen::Vector3d{0.0, 0.4, 0.0});
  std::vector<QuaternionD> const series{q, QuaternionD{nan, nan, nan, nan}};

  auto const out = CalibrationEngine::applyOffset(series, QuaternionOps::invert(q));

  ASSERT_EQ(out.size(), 2u);
  EXPECT_NEAR(QuaternionOps::angle(out[0]), 0.0, 1e-12);
  EXPECT_FALSE(out[1].allFinite());
}

TEST(CalibrationEngineTest, EulerXYZ_SingleAxis)
{
  auto const q = QuaternionOps::fromRotationVector(Eigen::Vector3d{0.3, 0.0, 0.0});

  Eigen::Vector3d const e = CalibrationEngine::eulerXYZ(q);

  EXPECT_NEAR(e.x(), 0.3, 1e-9);
  EXPECT_NEAR(e.y(), 0.0, 1e-9);
  EXPECT_NEAR(e.z(), 0.0, 1e-9);
}

// ============================================================================
// Full calibration
// ============================================================================

TEST(CalibrationEngineTest, StaticStart_ValidatesWithinTolerance)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const result = CalibrationEngine::calibrate(session);

  ASSERT_TRUE(result.isSuccess()) << result.reason();
  const auto& calibration = result.value();
  EXPECT_EQ(calibration.offsets.size(), session.jointCount());
  EXPECT_TRUE(calibration.validation.passed);
  for (const auto& joint : calibration.validation.joints)
  {
    EXPECT_LT(joint.medianResidualDeg, 1.0) << joint.jointName;
  }
}

TEST(CalibrationEngineTest, Offset_ZeroesReferenceOrientation)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});
  auto const result = CalibrationEngine::calibrate(session);
  ASSERT_TRUE(result.hasValue());

  auto const head = *session.skeleton().indexOf("Head");
  auto const offset = result.value().offsetFor(head);
  ASSERT_TRUE(offset.has_value());

  auto const zeroed = QuaternionOps::compose(
    offset->offset, session.track(head).orientations[result.value().window.startFrame]);
  EXPECT_NEAR(QuaternionOps::angle(zeroed), 0.0, 1e-6);
  // Head carries a 0.2 rad base rotation about y
  EXPECT_NEAR(QuaternionOps::angle(offset->offset), 0.2, 1e-6);
}

TEST(CalibrationEngineTest, HorizontalArms_PoseCorrectionNotApplied)
{
  auto const session = SyntheticSession::capture(SyntheticCapture{});

  auto const result = CalibrationEngine::calibrate(session);

  ASSERT_TRUE(result.hasValue());
  EXPECT_FALSE(result.value().pose.applied);
  ASSERT_EQ(result.value().anatomy.size(), 2u);
  EXPECT_NEAR(result.value().anatomy[0].deviationScore, 0.0, 1e-3);

  // Nothing to apply, so the session is returned unchanged
  auto const corrected =
    CalibrationEngine::applyPoseCorrection(session, result.value());
  EXPECT_TRUE(corrected.track(3).positions.isApprox(session.track(3).positions));
}

TEST(CalibrationEngineTest, MovingThroughout_Degraded)
{
  SyntheticCapture settings;
  settings.staticSeconds = 0.0;
  auto const session = SyntheticSession::capture(settings);

  auto const result = CalibrationEngine::calibrate(session);

  ASSERT_TRUE(result.isDegraded());
  EXPECT_TRUE(result.value().window.isFallback);
  EXPECT_FALSE(result.value().offsets.empty());
}
