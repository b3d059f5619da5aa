// Ticket: 0006_temporal_resampler

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Resampling/Interpolation.hpp"

using namespace mocap_core;

// ============================================================================
// Monotone cubic
// ============================================================================

TEST(MonotoneCubicTest, HitsKnotsExactly)
{
  MonotoneCubic const spline{{0.0, 1.0, 2.0, 3.0}, {0.0, 2.0, 1.0, 5.0}};

  EXPECT_DOUBLE_EQ(spline(0.0), 0.0);
  EXPECT_DOUBLE_EQ(spline(1.0), 2.0);
  EXPECT_DOUBLE_EQ(spline(3.0), 5.0);
}

TEST(MonotoneCubicTest, StepData_DoesNotOvershoot)
{
  MonotoneCubic const spline{{0.0, 1.0, 2.0, 3.0, 4.0}, {0.0, 0.0, 0.0, 1.0, 1.0}};

  for (double x = 0.0; x <= 4.0; x += 0.05)
  {
    double const y = spline(x);
    EXPECT_GE(y, -1e-12) << "x = " << x;
    EXPECT_LE(y, 1.0 + 1e-12) << "x = " << x;
  }
}

TEST(MonotoneCubicTest, LinearData_IsReproduced)
{
  MonotoneCubic const spline{{0.0, 1.0, 2.5, 4.0}, {1.0, 3.0, 6.0, 9.0}};
  EXPECT_NEAR(spline(1.7), 1.0 + 2.0 * 1.7, 1e-12);
}

TEST(MonotoneCubicTest, OutsideSpan_IsNaN)
{
  MonotoneCubic const spline{{0.0, 1.0}, {0.0, 1.0}};
  EXPECT_TRUE(std::isnan(spline(-0.1)));
  EXPECT_TRUE(std::isnan(spline(1.1)));
}

TEST(MonotoneCubicTest, BadKnots_Throw)
{
  EXPECT_THROW((MonotoneCubic{{0.0}, {1.0}}), std::invalid_argument);
  EXPECT_THROW((MonotoneCubic{{0.0, 0.0}, {1.0, 2.0}}), std::invalid_argument);
  EXPECT_THROW((MonotoneCubic{{0.0, 1.0}, {1.0}}), std::invalid_argument);
}

// ============================================================================
// Linear and slerp
// ============================================================================

TEST(InterpolationTest, Linear_NeverExtrapolates)
{
  std::vector<double> const x{1.0, 2.0};
  std::vector<double> const y{10.0, 20.0};
  std::vector<double> const xq{0.5, 1.5, 2.5};

  auto const values = Interpolation::linear(x, y, xq);

  EXPECT_TRUE(std::isnan(values[0]));
  EXPECT_DOUBLE_EQ(values[1], 15.0);
  EXPECT_TRUE(std::isnan(values[2]));
}

TEST(InterpolationTest, Slerp_FollowsConstantRotationThroughSignFlips)
{
  std::vector<double> const times{0.0, 1.0, 2.0};
  QuaternionSeries const keys{
    QuaternionOps::fromRotationVector(Eigen::Vector3d{0.0, 0.0, 0.0}),
    QuaternionOps::fromRotationVector(Eigen::Vector3d{0.0, 0.0, 0.5}).negated(),
    QuaternionOps::fromRotationVector(Eigen::Vector3d{0.0, 0.0, 1.0})};
  std::vector<double> const xq{0.25, 1.5, 2.5};

  auto const out = Interpolation::slerp(times, keys, xq);

  EXPECT_NEAR(QuaternionOps::toRotationVector(out[0]).z(), 0.125, 1e-12);
  EXPECT_NEAR(QuaternionOps::toRotationVector(out[1]).z(), 0.75, 1e-12);
  EXPECT_FALSE(out[2].allFinite());
}

TEST(InterpolationTest, Slerp_UnsortedTimes_Throw)
{
  std::vector<double> const times{0.0, 2.0, 1.0};
  QuaternionSeries const keys(3, QuaternionD{1.0, 0.0, 0.0, 0.0});
  std::vector<double> const xq{0.5};

  EXPECT_THROW((void)Interpolation::slerp(times, keys, xq), std::invalid_argument);
}
