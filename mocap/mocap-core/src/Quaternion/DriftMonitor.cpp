// Ticket: 0005_quaternion_drift_monitor

#include "mocap-core/src/Quaternion/DriftMonitor.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

std::string toString(DriftStatus status)
{
  switch (status)
  {
    case DriftStatus::Excellent:
      return "EXCELLENT";
    case DriftStatus::Good:
      return "GOOD";
    case DriftStatus::Acceptable:
      return "ACCEPTABLE";
    case DriftStatus::Poor:
      return "POOR";
  }
  return "UNKNOWN";
}

std::string toString(IntegrityStatus status)
{
  switch (status)
  {
    case IntegrityStatus::Pass:
      return "PASS";
    case IntegrityStatus::Warn:
      return "WARN";
    case IntegrityStatus::Fail:
      return "FAIL";
  }
  return "UNKNOWN";
}

DriftMonitor::DriftReport DriftMonitor::analyze(
  std::span<const QuaternionD> series,
  std::span<const double> times,
  const Config& config)
{
  DriftReport report;

  std::vector<double> errors;
  std::vector<double> errorTimes;
  errors.reserve(series.size());
  bool const timed = times.size() == series.size();
  for (std::size_t i = 0; i < series.size(); ++i)
  {
    if (!series[i].allFinite())
    {
      continue;
    }
    errors.push_back(std::abs(series[i].norm() - 1.0));
    if (timed)
    {
      errorTimes.push_back(times[i]);
    }
  }

  if (errors.empty())
  {
    return report;
  }

  report.maxNormError = *std::max_element(errors.begin(), errors.end());
  report.meanNormError = stats::mean(errors);
  report.stdNormError = stats::stddev(errors);
  for (double const e : errors)
  {
    if (e > config.driftThreshold)
    {
      ++report.driftFrameCount;
    }
  }
  report.driftPercentage = 100.0 * static_cast<double>(report.driftFrameCount) /
                           static_cast<double>(series.size());

  if (timed && errorTimes.size() > 1)
  {
    double const duration = errorTimes.back() - errorTimes.front();
    if (duration > 0.0)
    {
      report.driftRatePerSecond = (errors.back() - errors.front()) / duration;
    }
    if (errors.size() > 10)
    {
      report.temporalTrend = stats::linearSlope(errorTimes, errors);
    }
  }

  if (report.maxNormError < 1e-6)
  {
    report.status = DriftStatus::Excellent;
  }
  else if (report.maxNormError < 1e-3)
  {
    report.status = DriftStatus::Good;
  }
  else if (report.maxNormError < 1e-2)
  {
    report.status = DriftStatus::Acceptable;
  }
  else
  {
    report.status = DriftStatus::Poor;
  }
  report.requiresCorrection = report.maxNormError > config.correctionThreshold;

  return report;
}

DriftMonitor::DriftReport DriftMonitor::analyze(
  std::span<const QuaternionD> series,
  std::span<const double> times)
{
  return analyze(series, times, Config{});
}

DriftMonitor::IntegrityReport DriftMonitor::validate(
  std::span<const QuaternionD> series,
  std::span<const double> times,
  bool strict)
{
  IntegrityReport report;

  for (const auto& q : series)
  {
    if (!q.allFinite())
    {
      report.status = IntegrityStatus::Fail;
      report.reason = "NaN or Inf values detected";
      report.hasNonFinite = true;
      return report;
    }
  }

  report.drift = analyze(series, times);
  report.discontinuities = QuaternionOps::countDiscontinuities(series);
  report.minDotProduct = QuaternionOps::minConsecutiveDot(series);

  if (strict)
  {
    report.normalizationOk = report.drift.maxNormError < 1e-3;
    report.continuityOk = report.discontinuities == 0;
  }
  else
  {
    report.normalizationOk = report.drift.maxNormError < 1e-2;
    report.continuityOk = static_cast<double>(report.discontinuities) <
                          0.01 * static_cast<double>(series.size());
  }

  if (report.normalizationOk && report.continuityOk)
  {
    report.status = IntegrityStatus::Pass;
  }
  else if (report.normalizationOk || report.continuityOk)
  {
    report.status = IntegrityStatus::Warn;
    report.reason = report.normalizationOk ? "hemisphere discontinuities"
                                           : "normalization error";
  }
  else
  {
    report.status = IntegrityStatus::Fail;
    report.reason = "normalization error and hemisphere discontinuities";
  }
  return report;
}

DriftMonitor::CorrectionResult DriftMonitor::correct(
  std::span<const QuaternionD> series,
  std::span<const double> times)
{
  CorrectionResult result;
  result.before = validate(series, times, false);

  DriftReport const drift = analyze(series, times);
  result.framesCorrected = drift.driftFrameCount;

  result.corrected = QuaternionOps::enforceContinuity(
    QuaternionOps::normalizeSeries(series));

  for (const auto& q : result.corrected)
  {
    if (q.allFinite())
    {
      result.residualErrorAfter =
        std::max(result.residualErrorAfter, std::abs(q.norm() - 1.0));
    }
  }

  if (drift.requiresCorrection)
  {
    spdlog::warn(
      "DriftMonitor: quaternion drift detected, max error = {:.4f}, {:.1f}% of "
      "frames corrected",
      drift.maxNormError,
      drift.driftPercentage);
  }
  else
  {
    spdlog::debug("DriftMonitor: max drift = {:.6f} ({})",
                  drift.maxNormError,
                  toString(drift.status));
  }

  result.after = validate(result.corrected, times, false);
  spdlog::debug("DriftMonitor: correction {} -> {}",
                toString(result.before.status),
                toString(result.after.status));
  return result;
}

}  // namespace mocap_core
