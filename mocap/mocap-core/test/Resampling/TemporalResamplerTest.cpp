// Ticket: 0006_temporal_resampler

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Resampling/TemporalResampler.hpp"
#include "mocap-core/src/Resampling/TimeGrid.hpp"

using namespace mocap_core;

namespace
{

// Smooth single-joint motion sampled at the given times
MotionSession smoothSession(const std::vector<double>& times)
{
  Skeleton skeleton{{"Hips"}, {Skeleton::kNoParent}};
  JointTrack track;
  track.positions.resize(static_cast<Eigen::Index>(times.size()), 3);
  for (std::size_t i = 0; i < times.size(); ++i)
  {
    double const t = times[i];
    auto const row = static_cast<Eigen::Index>(i);
    track.positions(row, 0) = 100.0 * std::sin(2.0 * M_PI * 0.5 * t);
    track.positions(row, 1) = 1000.0 + 20.0 * t;
    track.positions(row, 2) = 50.0 * std::cos(2.0 * M_PI * 0.3 * t);
    track.orientations.push_back(
      QuaternionOps::fromRotationVector(Eigen::Vector3d{0.0, 0.4 * t, 0.0}));
  }
  return MotionSession{"resample", skeleton, times, {track}};
}

std::vector<double> uniform(double fs, std::size_t n)
{
  std::vector<double> times(n);
  for (std::size_t i = 0; i < n; ++i)
  {
    times[i] = static_cast<double>(i) / fs;
  }
  return times;
}

}  // namespace

TEST(TemporalResamplerTest, UniformInputAtTargetRate_IsUnchanged)
{
  auto const session = smoothSession(uniform(120.0, 600));
  TemporalResampler::Config config;
  config.maskVelocityArtifacts = false;

  auto const result = TemporalResampler::resample(session, config);

  ASSERT_EQ(result.session.frameCount(), session.frameCount());
  for (std::size_t i = 0; i < session.frameCount(); ++i)
  {
    auto const before = session.pose(0, i);
    auto const after = result.session.pose(0, i);
    EXPECT_NEAR((before.position - after.position).norm(), 0.0, 1e-9) << "frame " << i;
    EXPECT_NEAR(QuaternionOps::angleBetween(before.orientation, after.orientation), 0.0, 1e-9);
  }
}

TEST(TemporalResamplerTest, JitteredInput_YieldsUniformGrid)
{
  auto times = uniform(100.0, 500);
  for (std::size_t i = 1; i + 1 < times.size(); ++i)
  {
    times[i] += (i % 2 == 0 ? 1.0 : -1.0) * 0.002;
  }

  auto const result = TemporalResampler::resample(smoothSession(times));

  EXPECT_LT(result.gridDeltaStd, 1e-12);
  EXPECT_GT(result.sourceJitterMs, 1.0);
  EXPECT_GT(result.sourceRate, 50.0);
  EXPECT_LE(result.session.times().back(), times.back());
}

TEST(TemporalResamplerTest, NonIntegralDuration_KeepsZeroDeltaVariance)
{
  auto times = uniform(100.0, 334);  // 3.33 s
  auto const result = TemporalResampler::resample(smoothSession(times));

  EXPECT_EQ(result.session.frameCount(), 400u);  // floor(3.33 * 120) + 1
  EXPECT_LT(TimeGrid::deltaStd(result.session.times()), 1e-12);
}

TEST(TemporalResamplerTest, LeadingMissingPositions_AreNotExtrapolated)
{
  auto const source = smoothSession(uniform(100.0, 200));
  JointTrack track = source.track(0);
  for (Eigen::Index i = 0; i < 10; ++i)
  {
    track.positions.row(i).setConstant(std::nan(""));
  }
  TemporalResampler::Config config;
  config.maskVelocityArtifacts = false;

  auto const result = TemporalResampler::resample(source.withTrack(0, track), config);

  EXPECT_TRUE(std::isnan(result.session.pose(0, 0).position.x()));
  EXPECT_FALSE(std::isnan(result.session.pose(0, 20).position.x()));
}

TEST(TemporalResamplerTest, MissingOrientation_IsFatal)
{
  auto const source = smoothSession(uniform(100.0, 50));
  JointTrack track = source.track(0);
  track.orientations[10] = QuaternionD::missing();

  EXPECT_THROW((void)TemporalResampler::resample(source.withTrack(0, track)),
               std::runtime_error);
}

TEST(TemporalResamplerTest, InvalidTargetRate_Throws)
{
  TemporalResampler::Config config;
  config.targetRate = 0.0;
  EXPECT_THROW((void)TemporalResampler::resample(smoothSession(uniform(100.0, 50)), config),
               std::invalid_argument);
}
