// Ticket: 0012_kinematics_derivation

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

#include "mocap-core/src/Kinematics/AngularVelocityEstimator.hpp"
#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticSession;

namespace
{

constexpr double kFs = 120.0;
constexpr double kDt = 1.0 / kFs;

QuaternionSeries spinAboutZ(double rate, std::size_t n)
{
  auto const times = SyntheticSession::uniformTimes(kFs, n);
  return SyntheticSession::constantRotation(Eigen::Vector3d::UnitZ(), rate, times);
}

QuaternionSeries withOrientationNoise(QuaternionSeries series, double sigmaRad)
{
  std::mt19937 rng{11};
  std::normal_distribution<double> noise{0.0, sigmaRad};
  for (auto& q : series)
  {
    Eigen::Vector3d const rv{noise(rng), noise(rng), noise(rng)};
    q = QuaternionOps::compose(q, QuaternionOps::fromRotationVector(rv));
  }
  return series;
}

}  // namespace

// ============================================================================
// Quaternion log
// ============================================================================

TEST(AngularVelocityEstimatorTest, QuaternionLog_ConstantRate_Exact)
{
  auto const q = spinAboutZ(2.0, 240);

  auto const omega = AngularVelocityEstimator::quaternionLog(q, kDt, RotationFrame::Local);

  ASSERT_EQ(omega.rows(), 240);
  for (Eigen::Index i = 0; i < omega.rows(); ++i)
  {
    EXPECT_NEAR(omega(i, 2), 2.0, 2.0 * 1e-3) << "frame " << i;
    EXPECT_NEAR(omega(i, 0), 0.0, 1e-9);
  }
}

TEST(AngularVelocityEstimatorTest, QuaternionLog_SignFlip_Ignored)
{
  auto q = spinAboutZ(1.0, 20);
  q[10] = q[10].negated();

  auto const omega = AngularVelocityEstimator::quaternionLog(q, kDt, RotationFrame::Local);

  EXPECT_NEAR(omega(9, 2), 1.0, 1e-6);
  EXPECT_NEAR(omega(10, 2), 1.0, 1e-6);
}

TEST(AngularVelocityEstimatorTest, LocalAndGlobal_AgreeForFixedAxis)
{
  auto const q = spinAboutZ(3.0, 60);

  auto const local = AngularVelocityEstimator::quaternionLog(q, kDt, RotationFrame::Local);
  auto const global =
    AngularVelocityEstimator::quaternionLog(q, kDt, RotationFrame::Global);

  EXPECT_TRUE(local.isApprox(global, 1e-9));
}

TEST(AngularVelocityEstimatorTest, SimpleRate_MissingSample_Nan)
{
  double const nan = std::numeric_limits<double>::quiet_NaN();
  QuaternionD const missing{nan, nan, nan, nan};

  auto const rate = AngularVelocityEstimator::simpleRate(
    QuaternionD{}, missing, kDt, RotationFrame::Local);

  EXPECT_TRUE(std::isnan(rate.x()));
}

TEST(AngularVelocityEstimatorTest, NonPositiveStep_Throws)
{
  auto const q = spinAboutZ(1.0, 10);
  EXPECT_THROW((void)AngularVelocityEstimator::quaternionLog(q, 0.0, RotationFrame::Local),
               std::invalid_argument);
}

// ============================================================================
// Estimator comparison
// ============================================================================

TEST(AngularVelocityEstimatorTest, FivePoint_LessNoisyThanCentral)
{
  auto const q = withOrientationNoise(spinAboutZ(2.0, 600), 0.002);

  auto const c = AngularVelocityEstimator::compare(q, kDt, RotationFrame::Local);

  EXPECT_LT(c.noiseFivePoint, c.noiseCentral);
  EXPECT_LT(c.noiseCentral, c.noiseLog);
  EXPECT_GT(c.noiseReductionFivePoint, 1.0);
  EXPECT_FALSE(c.recommendation.empty());
}

TEST(AngularVelocityEstimatorTest, Compare_MeanMagnitudesAgree)
{
  auto const q = spinAboutZ(2.0, 240);

  auto const c = AngularVelocityEstimator::compare(q, kDt, RotationFrame::Local);

  EXPECT_NEAR(c.meanMagnitudeLog, 2.0, 1e-6);
  EXPECT_NEAR(c.meanMagnitudeFivePoint, 2.0, 1e-6);
  EXPECT_NEAR(c.meanMagnitudeCentral, 2.0, 1e-6);
  EXPECT_NEAR(c.agreementLogFivePoint, 0.0, 1e-6);
}
