// Ticket: 0015_burst_classification

#include "mocap-core/src/Gates/BurstClassifier.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{

struct Run
{
  std::size_t start;
  std::size_t end;  // exclusive
};

std::vector<Run> runsAbove(const Eigen::VectorXd& values, double trigger)
{
  std::vector<Run> runs;
  bool inRun = false;
  std::size_t start = 0;
  auto const n = static_cast<std::size_t>(values.size());
  for (std::size_t i = 0; i < n; ++i)
  {
    bool const above = values(static_cast<Eigen::Index>(i)) > trigger;
    if (above && !inRun)
    {
      start = i;
      inRun = true;
    }
    else if (!above && inRun)
    {
      runs.push_back(Run{start, i});
      inRun = false;
    }
  }
  if (inRun)
  {
    runs.push_back(Run{start, n});
  }
  return runs;
}

VelocityStatistics describe(const std::vector<double>& values)
{
  VelocityStatistics s;
  auto const finite = stats::finiteOnly(values);
  s.samples = finite.size();
  if (finite.empty())
  {
    return s;
  }
  s.max = *std::max_element(finite.begin(), finite.end());
  s.mean = stats::mean(finite);
  s.stddev = stats::stddev(finite);
  s.p95 = stats::percentile(finite, 95.0);
  s.p99 = stats::percentile(finite, 99.0);
  return s;
}

EventDensity assessDensity(const std::vector<BurstEvent>& events,
                           std::size_t frames,
                           double fs,
                           const BurstClassifier::Config& config)
{
  EventDensity d;
  d.totalEvents = events.size();
  d.durationMinutes = static_cast<double>(frames) / fs / 60.0;
  if (events.empty())
  {
    d.reason = "No high-velocity events detected";
    return d;
  }

  for (const auto& e : events)
  {
    if (e.tier == BurstTier::Artifact)
    {
      d.artifactFrames += e.durationFrames;
    }
    else if (e.tier == BurstTier::Burst)
    {
      ++d.burstEvents;
    }
  }
  d.artifactRatePercent =
    frames > 0 ? 100.0 * static_cast<double>(d.artifactFrames) / static_cast<double>(frames)
               : 0.0;
  d.burstsPerMinute = d.durationMinutes > 0.0
                        ? static_cast<double>(d.burstEvents) / d.durationMinutes
                        : 0.0;

  std::vector<std::string> reject;
  std::vector<std::string> review;
  if (d.artifactRatePercent > config.artifactRateRejectPercent)
  {
    reject.push_back(fmt::format("Artifact rate {:.2f}% > {}%",
                                 d.artifactRatePercent,
                                 config.artifactRateRejectPercent));
  }
  else if (d.artifactRatePercent > config.artifactRateWarnPercent)
  {
    review.push_back(fmt::format("Artifact rate {:.2f}% > {}%",
                                 d.artifactRatePercent,
                                 config.artifactRateWarnPercent));
  }
  if (d.burstsPerMinute > config.burstsPerMinuteReject)
  {
    reject.push_back(fmt::format("Burst frequency {:.1f}/min > {}/min",
                                 d.burstsPerMinute,
                                 config.burstsPerMinuteReject));
  }
  else if (d.burstsPerMinute > config.burstsPerMinuteWarn)
  {
    review.push_back(fmt::format("Burst frequency {:.1f}/min > {}/min",
                                 d.burstsPerMinute,
                                 config.burstsPerMinuteWarn));
  }
  if (d.totalEvents > config.totalEventsReject)
  {
    reject.push_back(
      fmt::format("Total events {} > {}", d.totalEvents, config.totalEventsReject));
  }
  else if (d.totalEvents > config.totalEventsWarn)
  {
    review.push_back(
      fmt::format("Total events {} > {}", d.totalEvents, config.totalEventsWarn));
  }

  auto joined = [](const std::vector<std::string>& parts)
  {
    std::string out;
    for (const auto& p : parts)
    {
      out += out.empty() ? p : "; " + p;
    }
    return out;
  };

  if (!reject.empty())
  {
    d.level = DensityLevel::Excessive;
    d.reason = "REJECT: " + joined(reject);
  }
  else if (!review.empty())
  {
    d.level = DensityLevel::High;
    d.reason = "REVIEW: " + joined(review);
  }
  else
  {
    d.reason = fmt::format("Event density acceptable: {} events in {:.1f} min",
                           d.totalEvents,
                           d.durationMinutes);
  }
  return d;
}

}  // namespace

std::string toString(BurstTier tier)
{
  switch (tier)
  {
    case BurstTier::Normal:
      return "NORMAL";
    case BurstTier::Artifact:
      return "ARTIFACT";
    case BurstTier::Burst:
      return "BURST";
    case BurstTier::Flow:
      return "FLOW";
  }
  return "UNKNOWN";
}

std::string toString(DensityLevel level)
{
  switch (level)
  {
    case DensityLevel::Acceptable:
      return "ACCEPTABLE";
    case DensityLevel::High:
      return "HIGH";
    case DensityLevel::Excessive:
      return "EXCESSIVE";
  }
  return "UNKNOWN";
}

BurstTier BurstClassifier::tierFor(std::size_t durationFrames, const Config& config)
{
  if (durationFrames == 0)
  {
    return BurstTier::Normal;
  }
  if (durationFrames <= config.artifactMaxFrames)
  {
    return BurstTier::Artifact;
  }
  if (durationFrames <= config.burstMaxFrames)
  {
    return BurstTier::Burst;
  }
  return BurstTier::Flow;
}

Eigen::MatrixXd BurstClassifier::angularSpeed(const KinematicsResult& kinematics)
{
  auto const frames = static_cast<Eigen::Index>(kinematics.times.size());
  auto const joints = static_cast<Eigen::Index>(kinematics.joints.size());
  Eigen::MatrixXd speed(frames, joints);
  for (Eigen::Index j = 0; j < joints; ++j)
  {
    speed.col(j) =
      kinematics.joints[static_cast<std::size_t>(j)].angularVelocityDeg.rowwise().norm();
  }
  return speed;
}

CleanStatistics BurstClassifier::cleanStatistics(
  const Eigen::MatrixXd& magnitudeDeg,
  const std::vector<std::string>& jointNames,
  const std::vector<std::size_t>& framesToExclude)
{
  std::set<std::size_t> const excluded(framesToExclude.begin(), framesToExclude.end());
  auto const frames = static_cast<std::size_t>(magnitudeDeg.rows());

  std::vector<double> raw;
  std::vector<double> clean;
  raw.reserve(static_cast<std::size_t>(magnitudeDeg.size()));
  CleanStatistics s;
  for (Eigen::Index j = 0; j < magnitudeDeg.cols(); ++j)
  {
    std::vector<double> jointClean;
    for (std::size_t i = 0; i < frames; ++i)
    {
      double const v = std::abs(magnitudeDeg(static_cast<Eigen::Index>(i), j));
      raw.push_back(v);
      if (excluded.count(i) == 0)
      {
        clean.push_back(v);
        jointClean.push_back(v);
      }
    }
    s.perJointClean[jointNames[static_cast<std::size_t>(j)]] = describe(jointClean);
  }

  s.raw = describe(raw);
  s.clean = describe(clean);
  s.excludedFrames = excluded.size();
  s.dataRetainedPercent =
    frames > 0 ? 100.0 * static_cast<double>(frames - excluded.size()) /
                   static_cast<double>(frames)
               : 100.0;
  return s;
}

BurstClassification BurstClassifier::classify(const Eigen::MatrixXd& magnitudeDeg,
                                              const std::vector<std::string>& jointNames,
                                              double fs,
                                              const Config& config)
{
  if (static_cast<std::size_t>(magnitudeDeg.cols()) != jointNames.size())
  {
    throw std::invalid_argument{
      "BurstClassifier: one joint name per column is required"};
  }
  if (!(fs > 0.0))
  {
    throw std::invalid_argument{"BurstClassifier: sampling rate must be positive"};
  }

  auto const frames = static_cast<std::size_t>(magnitudeDeg.rows());
  double const frameMs = 1000.0 / fs;

  BurstClassification result;
  result.statusMask = Eigen::MatrixXi::Zero(magnitudeDeg.rows(), magnitudeDeg.cols());

  std::set<std::size_t> exclude;
  std::set<std::size_t> review;
  for (Eigen::Index j = 0; j < magnitudeDeg.cols(); ++j)
  {
    Eigen::VectorXd const speed = magnitudeDeg.col(j).cwiseAbs();
    for (const auto& run : runsAbove(speed, config.velocityTrigger))
    {
      BurstEvent e;
      e.id = result.events.size() + 1;
      e.joint = static_cast<std::size_t>(j);
      e.jointName = jointNames[e.joint];
      e.startFrame = run.start;
      e.endFrame = run.end;
      e.durationFrames = run.end - run.start;
      e.durationMs = static_cast<double>(e.durationFrames) * frameMs;
      auto const segment = speed.segment(static_cast<Eigen::Index>(run.start),
                                         static_cast<Eigen::Index>(e.durationFrames));
      e.maxVelocityDeg = segment.maxCoeff();
      e.meanVelocityDeg = segment.mean();
      e.tier = tierFor(e.durationFrames, config);

      switch (e.tier)
      {
        case BurstTier::Artifact:
          e.status = GateStatus::Review;
          e.action = "EXCLUDE";
          ++result.artifactCount;
          break;
        case BurstTier::Burst:
          e.status = GateStatus::Review;
          e.action = "INCLUDE_FLAGGED";
          ++result.burstCount;
          break;
        case BurstTier::Flow:
        case BurstTier::Normal:
          if (e.meanVelocityDeg > config.velocityExtreme)
          {
            e.status = GateStatus::Review;
            e.action = "INCLUDE_FLAGGED";
          }
          else
          {
            e.status = GateStatus::AcceptHighIntensity;
            e.action = "INCLUDE";
          }
          ++result.flowCount;
          break;
      }

      result.statusMask.block(static_cast<Eigen::Index>(run.start),
                              j,
                              static_cast<Eigen::Index>(e.durationFrames),
                              1)
        .setConstant(static_cast<int>(e.tier));
      for (std::size_t f = run.start; f < run.end; ++f)
      {
        if (e.tier == BurstTier::Artifact)
        {
          exclude.insert(f);
        }
        else if (e.status == GateStatus::Review)
        {
          review.insert(f);
        }
      }
      result.events.push_back(std::move(e));
    }
  }
  result.framesToExclude.assign(exclude.begin(), exclude.end());
  result.framesToReview.assign(review.begin(), review.end());

  result.density = assessDensity(result.events, frames, fs, config);
  result.statistics = cleanStatistics(magnitudeDeg, jointNames, result.framesToExclude);

  std::size_t const extremeFlows = static_cast<std::size_t>(
    std::count_if(result.events.begin(),
                  result.events.end(),
                  [&config](const BurstEvent& e)
                  {
                    return e.tier == BurstTier::Flow &&
                           e.meanVelocityDeg > config.velocityExtreme;
                  }));

  GateVerdict& verdict = result.verdict;
  verdict.gate = 5;
  verdict.name = "burst_classification";
  if (result.events.empty())
  {
    verdict.status = GateStatus::Pass;
  }
  else if (result.density.level == DensityLevel::Excessive)
  {
    verdict.status = GateStatus::Reject;
    verdict.reason = result.density.reason;
  }
  else if (result.artifactCount > 0)
  {
    verdict.status = GateStatus::Review;
    verdict.reason = fmt::format("REVIEW: High-Speed Artifact - {} event(s) of at "
                                 "most {} frame(s)",
                                 result.artifactCount,
                                 config.artifactMaxFrames);
  }
  else if (result.burstCount > 0)
  {
    verdict.status = GateStatus::Review;
    verdict.reason = fmt::format("REVIEW: High-Speed Burst - {} event(s) of {}-{} "
                                 "frames, visual audit required",
                                 result.burstCount,
                                 config.artifactMaxFrames + 1,
                                 config.burstMaxFrames);
  }
  else if (extremeFlows > 0)
  {
    verdict.status = GateStatus::Review;
    verdict.reason = fmt::format("REVIEW: Extreme Sustained Velocity - {} flow "
                                 "event(s) with mean > {:.0f} deg/s",
                                 extremeFlows,
                                 config.velocityExtreme);
  }
  else if (result.density.level == DensityLevel::High)
  {
    verdict.status = GateStatus::Review;
    verdict.reason = result.density.reason;
  }
  else
  {
    verdict.status = GateStatus::AcceptHighIntensity;
    verdict.notes.push_back(fmt::format("{} sustained flow event(s) accepted",
                                        result.flowCount));
  }

  verdict.metrics["total_events"] = static_cast<double>(result.events.size());
  verdict.metrics["artifact_count"] = static_cast<double>(result.artifactCount);
  verdict.metrics["burst_count"] = static_cast<double>(result.burstCount);
  verdict.metrics["flow_count"] = static_cast<double>(result.flowCount);
  verdict.metrics["artifact_rate_percent"] = result.density.artifactRatePercent;
  verdict.metrics["bursts_per_minute"] = result.density.burstsPerMinute;
  verdict.metrics["excluded_frames"] = static_cast<double>(result.framesToExclude.size());
  verdict.metrics["raw_max_deg_s"] = result.statistics.raw.max;
  verdict.metrics["clean_max_deg_s"] = result.statistics.clean.max;

  spdlog::info("Gate 5: {} ({} artifact(s), {} burst(s), {} flow(s), density {})",
               toString(verdict.status),
               result.artifactCount,
               result.burstCount,
               result.flowCount,
               toString(result.density.level));
  if (!result.framesToExclude.empty())
  {
    spdlog::info("Gate 5: max |omega| {:.1f} (raw) -> {:.1f} (clean) deg/s",
                 result.statistics.raw.max,
                 result.statistics.clean.max);
  }
  return result;
}

BurstClassification BurstClassifier::classify(const Eigen::MatrixXd& magnitudeDeg,
                                              const std::vector<std::string>& jointNames,
                                              double fs)
{
  return classify(magnitudeDeg, jointNames, fs, Config{});
}

BurstClassification BurstClassifier::classify(const KinematicsResult& kinematics,
                                              const Config& config)
{
  std::vector<std::string> names;
  names.reserve(kinematics.joints.size());
  for (const auto& joint : kinematics.joints)
  {
    names.push_back(joint.jointName);
  }
  return classify(angularSpeed(kinematics), names, kinematics.samplingRate, config);
}

}  // namespace mocap_core
