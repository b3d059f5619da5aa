// Ticket: 0020_snr_analysis

#include "mocap-core/src/Filtering/SnrAnalysis.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kNoiseFloor = 1e-12;
constexpr double kNoiseFreeDb = 100.0;

std::vector<double> columnOf(const Eigen::MatrixX3d& positions, Eigen::Index axis)
{
  std::vector<double> out(static_cast<std::size_t>(positions.rows()));
  for (Eigen::Index i = 0; i < positions.rows(); ++i)
  {
    out[static_cast<std::size_t>(i)] = positions(i, axis);
  }
  return out;
}

}  // namespace

std::string toString(SnrQuality quality)
{
  switch (quality)
  {
    case SnrQuality::Excellent:
      return "EXCELLENT";
    case SnrQuality::Good:
      return "GOOD";
    case SnrQuality::Acceptable:
      return "ACCEPTABLE";
    case SnrQuality::Poor:
      return "POOR";
    case SnrQuality::Reject:
      return "REJECT";
    case SnrQuality::Unknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

double SnrAnalysis::fromResiduals(std::span<const double> raw,
                                  std::span<const double> filtered,
                                  const Config& config)
{
  if (raw.size() != filtered.size())
  {
    throw std::invalid_argument{"SnrAnalysis: raw and filtered lengths differ"};
  }

  double signalPower = 0.0;
  double noisePower = 0.0;
  std::size_t count = 0;
  for (std::size_t i = 0; i < raw.size(); ++i)
  {
    if (!std::isfinite(raw[i]) || !std::isfinite(filtered[i]))
    {
      continue;
    }
    double const residual = raw[i] - filtered[i];
    signalPower += filtered[i] * filtered[i];
    noisePower += residual * residual;
    ++count;
  }
  if (count < config.minSamples)
  {
    return kNaN;
  }
  signalPower /= static_cast<double>(count);
  noisePower /= static_cast<double>(count);
  if (noisePower < kNoiseFloor)
  {
    return kNoiseFreeDb;
  }
  return 10.0 * std::log10(signalPower / noisePower);
}

double SnrAnalysis::fromResiduals(std::span<const double> raw,
                                  std::span<const double> filtered)
{
  return fromResiduals(raw, filtered, Config{});
}

SnrQuality SnrAnalysis::assess(double snrDb)
{
  if (std::isnan(snrDb))
  {
    return SnrQuality::Unknown;
  }
  if (snrDb >= 30.0)
  {
    return SnrQuality::Excellent;
  }
  if (snrDb >= 20.0)
  {
    return SnrQuality::Good;
  }
  if (snrDb >= 15.0)
  {
    return SnrQuality::Acceptable;
  }
  if (snrDb >= 10.0)
  {
    return SnrQuality::Poor;
  }
  return SnrQuality::Reject;
}

SnrAnalysis::Report SnrAnalysis::perJoint(const MotionSession& raw,
                                          const MotionSession& filtered,
                                          const Config& config)
{
  if (raw.jointCount() != filtered.jointCount() ||
      raw.frameCount() != filtered.frameCount())
  {
    throw std::invalid_argument{
      "SnrAnalysis: raw and filtered sessions differ in shape"};
  }

  Report report;
  std::vector<double> jointMeans;
  for (JointIndex j = 0; j < raw.jointCount(); ++j)
  {
    JointSnr joint;
    joint.jointName = raw.skeleton().name(j);
    for (Eigen::Index axis = 0; axis < 3; ++axis)
    {
      joint.axisDb[static_cast<std::size_t>(axis)] =
        fromResiduals(columnOf(raw.track(j).positions, axis),
                      columnOf(filtered.track(j).positions, axis),
                      config);
    }
    auto const finite = stats::finiteOnly(joint.axisDb);
    if (finite.empty())
    {
      joint.meanDb = kNaN;
      joint.minDb = kNaN;
    }
    else
    {
      joint.meanDb = stats::mean(finite);
      joint.minDb = *std::min_element(finite.begin(), finite.end());
      jointMeans.push_back(joint.meanDb);
      if (joint.meanDb < config.minAcceptableDb)
      {
        report.failedJoints.push_back(joint.jointName);
      }
    }
    joint.quality = assess(joint.meanDb);
    report.joints.push_back(std::move(joint));
  }

  if (jointMeans.empty())
  {
    report.meanDb = kNaN;
    report.minDb = kNaN;
    report.maxDb = kNaN;
  }
  else
  {
    report.meanDb = stats::mean(jointMeans);
    report.minDb = *std::min_element(jointMeans.begin(), jointMeans.end());
    report.maxDb = *std::max_element(jointMeans.begin(), jointMeans.end());
  }
  report.overall = assess(report.meanDb);

  spdlog::info("SnrAnalysis: mean {:.1f} dB ({}), {} joint(s) below {:.0f} dB",
               report.meanDb,
               toString(report.overall),
               report.failedJoints.size(),
               config.minAcceptableDb);
  return report;
}

SnrAnalysis::Report SnrAnalysis::perJoint(const MotionSession& raw,
                                          const MotionSession& filtered)
{
  return perJoint(raw, filtered, Config{});
}

}  // namespace mocap_core
