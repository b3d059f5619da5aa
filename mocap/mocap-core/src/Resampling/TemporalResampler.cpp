// Ticket: 0006_temporal_resampler

#include "mocap-core/src/Resampling/TemporalResampler.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Resampling/Interpolation.hpp"
#include "mocap-core/src/Resampling/TimeGrid.hpp"

namespace mocap_core
{

namespace
{

constexpr std::size_t kMinCubicSamples = 4;

}  // namespace

TemporalResampler::Result TemporalResampler::resample(
  const MotionSession& session)
{
  return resample(session, Config{});
}

TemporalResampler::Result TemporalResampler::resample(
  const MotionSession& session,
  const Config& config)
{
  if (session.frameCount() < 2)
  {
    throw std::invalid_argument{
      "TemporalResampler: at least two frames are required"};
  }
  if (!(config.targetRate > 0.0))
  {
    throw std::invalid_argument{
      "TemporalResampler: target rate must be positive"};
  }

  const auto& times = session.times();
  std::vector<double> grid =
    TimeGrid::build(times.front(), times.back(), config.targetRate);
  auto const m = static_cast<Eigen::Index>(grid.size());

  InterpolationLog log;
  std::vector<std::size_t> artifactCounts(session.jointCount(), 0);
  std::vector<JointTrack> tracks;
  tracks.reserve(session.jointCount());

  for (JointIndex j = 0; j < session.jointCount(); ++j)
  {
    const auto& source = session.track(j);
    const std::string& jointName = session.skeleton().name(j);

    // ---- Orientations ----
    for (const auto& q : source.orientations)
    {
      if (!q.allFinite())
      {
        throw std::runtime_error{"TemporalResampler: orientation channel of " +
                                 jointName + " contains NaN"};
      }
    }

    JointTrack out;
    out.orientations = Interpolation::slerp(times, source.orientations, grid);

    // ---- Positions ----
    Eigen::MatrixX3d positions = source.positions;
    if (config.maskVelocityArtifacts)
    {
      auto const detection =
        ArtifactDetector::detect(times, positions, config.artifacts);
      artifactCounts[j] = detection.artifactFrames;
      positions = ArtifactDetector::applyMask(positions, detection.mask);
    }

    out.positions.resize(m, 3);
    for (Eigen::Index axis = 0; axis < 3; ++axis)
    {
      std::vector<double> validTimes;
      std::vector<double> validValues;
      for (Eigen::Index i = 0; i < positions.rows(); ++i)
      {
        if (std::isfinite(positions(i, axis)))
        {
          validTimes.push_back(times[static_cast<std::size_t>(i)]);
          validValues.push_back(positions(i, axis));
        }
      }

      std::vector<double> values;
      bool const wantCubic =
        config.positionMethod == PositionInterpolation::MonotoneCubic;
      if (wantCubic && validTimes.size() >= kMinCubicSamples)
      {
        values = MonotoneCubic{validTimes, validValues}.evaluate(grid);
      }
      else if (validTimes.size() >= 2)
      {
        values = Interpolation::linear(validTimes, validValues, grid);
        if (wantCubic)
        {
          InterpolationLog::Event event;
          event.joint = jointName;
          event.channel = "position";
          event.intendedMethod = InterpolationMethod::MonotoneCubic;
          event.methodUsed = InterpolationMethod::Linear;
          event.gapEnd = grid.size() - 1;
          event.gapFrames = grid.size();
          event.reason = "only " + std::to_string(validTimes.size()) +
                         " valid samples on axis " + std::to_string(axis);
          log.record(std::move(event));
        }
      }
      else
      {
        values.assign(grid.size(), std::numeric_limits<double>::quiet_NaN());
        spdlog::warn("TemporalResampler: {} axis {} has {} valid sample(s), "
                     "left as NaN",
                     jointName,
                     axis,
                     validTimes.size());
      }

      for (Eigen::Index i = 0; i < m; ++i)
      {
        out.positions(i, axis) = values[static_cast<std::size_t>(i)];
      }
    }

    if (artifactCounts[j] > 0)
    {
      spdlog::debug("TemporalResampler: {} masked {} artifact frame(s)",
                    jointName,
                    artifactCounts[j]);
    }
    tracks.push_back(std::move(out));
  }

  double const sourceRate = TimeGrid::estimateSamplingRate(times);
  double const jitterMs = TimeGrid::deltaStd(times) * 1000.0;
  double const gridStd = TimeGrid::deltaStd(grid);

  spdlog::info("TemporalResampler: run {} {} frames at {:.2f} Hz -> {} frames "
               "at {:.2f} Hz (jitter {:.3f} ms)",
               session.runId(),
               session.frameCount(),
               sourceRate,
               grid.size(),
               config.targetRate,
               jitterMs);

  return Result{session.withTracks(std::move(grid), std::move(tracks)),
                std::move(artifactCounts),
                sourceRate,
                jitterMs,
                gridStd,
                std::move(log)};
}

}  // namespace mocap_core
