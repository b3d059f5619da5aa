// Ticket: 0011_anatomical_calibration

#include "mocap-core/src/Calibration/ReferenceWindowDetector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Resampling/TimeGrid.hpp"
#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{

constexpr std::size_t kMinMotionSamples = 3;

// Sample variance (n - 1) of the finite entries, NaN with fewer than two
double sampleVariance(const std::vector<double>& values)
{
  auto const finite = stats::finiteOnly(values);
  if (finite.size() < 2)
  {
    return std::numeric_limits<double>::quiet_NaN();
  }
  double const mu = stats::mean(finite);
  double sum = 0.0;
  for (double const v : finite)
  {
    sum += (v - mu) * (v - mu);
  }
  return sum / static_cast<double>(finite.size() - 1);
}

std::vector<JointIndex> resolveReferenceJoints(const MotionSession& session,
                                               const std::vector<std::string>& names,
                                               std::vector<std::string>& used)
{
  std::vector<JointIndex> joints;
  for (const auto& name : names)
  {
    if (auto idx = session.skeleton().indexOf(name))
    {
      joints.push_back(*idx);
      used.push_back(name);
    }
  }
  if (joints.empty())
  {
    for (JointIndex j = 0; j < session.jointCount(); ++j)
    {
      joints.push_back(j);
      used.push_back(session.skeleton().name(j));
    }
  }
  return joints;
}

}  // namespace

std::vector<double> ReferenceWindowDetector::motionProfile(
  const MotionSession& session)
{
  const auto& times = session.times();
  std::size_t const n = session.frameCount();
  std::vector<double> motion(n > 0 ? n - 1 : 0,
                             std::numeric_limits<double>::quiet_NaN());
  std::vector<double> magnitudes;
  magnitudes.reserve(session.jointCount());

  for (std::size_t t = 0; t + 1 < n; ++t)
  {
    double const dt = times[t + 1] - times[t];
    magnitudes.clear();
    for (const auto& track : session.tracks())
    {
      const auto& q0 = track.orientations[t];
      const auto& q1 = track.orientations[t + 1];
      if (!q0.allFinite() || !q1.allFinite())
      {
        continue;
      }
      auto const dq = QuaternionOps::compose(QuaternionOps::invert(q0), q1);
      magnitudes.push_back(QuaternionOps::toRotationVector(dq).norm() / dt);
    }
    if (!magnitudes.empty())
    {
      motion[t] = stats::median(magnitudes);
    }
  }
  return motion;
}

StageResult<ReferenceWindow> ReferenceWindowDetector::detect(
  const MotionSession& session,
  const Config& config)
{
  if (!(config.searchSeconds > 0.0) || !(config.windowSeconds > 0.0) ||
      !(config.stepSeconds > 0.0))
  {
    throw std::invalid_argument{
      "ReferenceWindowDetector: durations must be positive"};
  }
  if (session.frameCount() < kMinMotionSamples)
  {
    throw std::runtime_error{
      "ReferenceWindowDetector: session too short for a reference window"};
  }

  const auto& times = session.times();
  double const fs = TimeGrid::estimateSamplingRate(times);
  auto const windowFrames = static_cast<std::size_t>(
    std::max(1.0, std::round(config.windowSeconds * fs)));
  auto const stepFrames = static_cast<std::size_t>(
    std::max(1.0, std::round(config.stepSeconds * fs)));

  std::size_t searchFrames = 0;
  while (searchFrames < times.size() &&
         times[searchFrames] <= times.front() + config.searchSeconds)
  {
    ++searchFrames;
  }

  std::vector<std::string> usedJoints;
  auto const joints =
    resolveReferenceJoints(session, config.referenceJoints, usedJoints);
  auto const motion = motionProfile(session);
  std::size_t const minMotion = std::max(kMinMotionSamples, windowFrames / 3);

  std::vector<ReferenceWindow> candidates;
  std::size_t const lastStart =
    searchFrames > windowFrames ? searchFrames - windowFrames : 0;
  for (std::size_t start = 0; start <= lastStart; start += stepFrames)
  {
    std::size_t const end = std::min(start + windowFrames, times.size());

    double score = 0.0;
    bool scored = false;
    for (JointIndex j : joints)
    {
      const auto& positions = session.track(j).positions;
      for (Eigen::Index axis = 0; axis < 3; ++axis)
      {
        std::vector<double> column;
        column.reserve(end - start);
        for (std::size_t i = start; i < end; ++i)
        {
          column.push_back(positions(static_cast<Eigen::Index>(i), axis));
        }
        double const var = sampleVariance(column);
        if (std::isfinite(var))
        {
          score += var;
          scored = true;
        }
      }
    }

    std::vector<double> windowMotion;
    for (std::size_t i = start; i < std::min(end, motion.size()); ++i)
    {
      if (std::isfinite(motion[i]))
      {
        windowMotion.push_back(motion[i]);
      }
    }
    if (!scored || windowMotion.size() < minMotion)
    {
      continue;
    }

    ReferenceWindow window;
    window.startFrame = start;
    window.endFrame = end;
    window.startTime = times[start];
    window.endTime = times[end - 1];
    window.positionScore = score;
    window.meanMotion = stats::mean(windowMotion);
    window.stdMotion = stats::stddev(windowMotion);
    window.referenceJoints = usedJoints;
    candidates.push_back(std::move(window));
  }

  if (candidates.empty())
  {
    throw std::runtime_error{
      "ReferenceWindowDetector: no valid reference window in the first " +
      std::to_string(config.searchSeconds) + " s"};
  }

  std::stable_sort(candidates.begin(),
                   candidates.end(),
                   [](const ReferenceWindow& a, const ReferenceWindow& b)
                   { return a.positionScore < b.positionScore; });

  for (auto& window : candidates)
  {
    if (window.meanMotion < config.motionMeanThreshold &&
        window.stdMotion < config.motionStdThreshold)
    {
      window.method = "criteria";
      window.isFallback = false;
      spdlog::info("ReferenceWindowDetector: run {} window {:.2f}-{:.2f} s "
                   "(motion {:.3f} rad/s)",
                   session.runId(),
                   window.startTime,
                   window.endTime,
                   window.meanMotion);
      return StageResult<ReferenceWindow>::success(std::move(window));
    }
  }

  auto best = std::min_element(candidates.begin(),
                               candidates.end(),
                               [](const ReferenceWindow& a,
                                  const ReferenceWindow& b)
                               { return a.meanMotion < b.meanMotion; });
  ReferenceWindow window = *best;
  window.method = "fallback_min_motion";
  window.isFallback = true;
  spdlog::warn("ReferenceWindowDetector: run {} has no window meeting the "
               "motion criteria, using {:.2f}-{:.2f} s (motion {:.3f} rad/s)",
               session.runId(),
               window.startTime,
               window.endTime,
               window.meanMotion);
  return StageResult<ReferenceWindow>::degraded(
    std::move(window), "reference window chosen by minimum-motion fallback");
}

}  // namespace mocap_core
