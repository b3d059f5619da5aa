// Ticket: 0014_quality_gates

#include "mocap-core/src/Gates/QualityGates.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "mocap-core/src/Filtering/BodyRegion.hpp"
#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{

constexpr char kDefaultSequence[] = "ZXY";

bool contains(const std::string& haystack, const char* needle)
{
  return haystack.find(needle) != std::string::npos;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep)
{
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i)
  {
    if (i > 0)
    {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

}  // namespace

double QualityGates::jitterMs(std::span<const double> times)
{
  if (times.size() < 2)
  {
    return std::numeric_limits<double>::quiet_NaN();
  }
  auto dt = stats::finiteOnly(stats::diff(times));
  for (double& v : dt)
  {
    v *= 1000.0;
  }
  return stats::stddev(dt);
}

GateVerdict QualityGates::calibrationIntegrity(
  const StageResult<CalibrationResult>& calibration)
{
  GateVerdict verdict;
  verdict.gate = 1;
  verdict.name = "calibration_integrity";

  if (!calibration.hasValue())
  {
    verdict.status = GateStatus::Reject;
    verdict.reason = "REJECT: Calibration Failed - " + calibration.reason();
    spdlog::info("Gate 1: {} ({})", toString(verdict.status), calibration.reason());
    return verdict;
  }

  const auto& result = calibration.value();
  const auto& window = result.window;
  const auto& validation = result.validation;
  double maxResidual = 0.0;
  for (const auto& joint : validation.joints)
  {
    maxResidual = std::max(maxResidual, joint.medianResidualDeg);
    if (!joint.passed)
    {
      verdict.notes.push_back(fmt::format("{} median residual {:.2f} deg",
                                          joint.jointName,
                                          joint.medianResidualDeg));
    }
  }
  verdict.metrics["window_start_frame"] = static_cast<double>(window.startFrame);
  verdict.metrics["window_end_frame"] = static_cast<double>(window.endFrame);
  verdict.metrics["window_fallback"] = window.isFallback ? 1.0 : 0.0;
  verdict.metrics["window_mean_motion_rad_s"] = window.meanMotion;
  verdict.metrics["joints_validated"] = static_cast<double>(validation.joints.size());
  verdict.metrics["joints_failed"] = static_cast<double>(validation.failedJoints.size());
  verdict.metrics["max_median_residual_deg"] = maxResidual;
  verdict.metrics["tolerance_deg"] = validation.toleranceDeg;
  verdict.notes.push_back("window method " + window.method);

  if (calibration.isDegraded() || window.isFallback || !validation.passed)
  {
    std::vector<std::string> reasons;
    if (!calibration.reason().empty())
    {
      reasons.push_back(calibration.reason());
    }
    else
    {
      if (window.isFallback)
      {
        reasons.push_back("reference window chosen by minimum-motion fallback");
      }
      if (!validation.passed)
      {
        reasons.push_back(fmt::format("{} joint(s) exceed the residual tolerance",
                                      validation.failedJoints.size()));
      }
    }
    verdict.status = GateStatus::Review;
    verdict.reason = "REVIEW: Calibration Degraded - " + join(reasons, "; ");
  }

  spdlog::info("Gate 1: {} (window [{}, {}) {}, {} joint(s) failed)",
               toString(verdict.status),
               window.startFrame,
               window.endFrame,
               window.method,
               validation.failedJoints.size());
  return verdict;
}

GateVerdict QualityGates::temporalIntegrity(std::span<const double> sourceTimes,
                                            const InterpolationLog& log,
                                            std::size_t totalFrames,
                                            const Config& config)
{
  GateVerdict verdict;
  verdict.gate = 2;
  verdict.name = "temporal_integrity";
  std::vector<std::string> reasons;

  double const jitter = jitterMs(sourceTimes);
  verdict.metrics["jitter_ms"] = jitter;
  if (std::isfinite(jitter) && jitter > config.jitterReviewMs)
  {
    verdict.status = worst(verdict.status, GateStatus::Review);
    reasons.push_back(fmt::format("REVIEW: Temporal Jitter - std(dt) = {:.2f} ms "
                                  "> {:.1f} ms",
                                  jitter,
                                  config.jitterReviewMs));
  }

  std::size_t fallbackFrames = 0;
  std::size_t maxGap = 0;
  for (const auto& [joint, summary] : log.perJoint())
  {
    if (summary.fallbackCount > 0)
    {
      fallbackFrames += summary.framesInterpolated;
    }
    maxGap = std::max(maxGap, summary.maxGapFrames);
  }
  double const rate = totalFrames > 0 ? 100.0 * static_cast<double>(fallbackFrames) /
                                          static_cast<double>(totalFrames)
                                      : 0.0;
  auto const summary = log.summarize();
  verdict.metrics["fallback_count"] = static_cast<double>(summary.totalFallbacks);
  verdict.metrics["fallback_frames"] = static_cast<double>(fallbackFrames);
  verdict.metrics["fallback_rate_percent"] = rate;
  verdict.metrics["max_gap_frames"] = static_cast<double>(maxGap);
  for (const auto& joint : summary.jointsWithFallbacks)
  {
    verdict.notes.push_back("fallback on " + joint);
  }

  if (rate > config.fallbackRejectPercent)
  {
    verdict.status = worst(verdict.status, GateStatus::Reject);
    reasons.push_back(fmt::format("REJECT: Excessive Interpolation - {:.2f}% frames "
                                  "compromised by linear fallback",
                                  rate));
  }
  else if (rate > config.fallbackReviewPercent)
  {
    verdict.status = worst(verdict.status, GateStatus::Review);
    reasons.push_back(fmt::format("REVIEW: Interpolation Fallback - {:.2f}% frames "
                                  "used linear fallback",
                                  rate));
  }

  verdict.reason = join(reasons, "; ");
  spdlog::info("Gate 2: {} (jitter {:.3f} ms, fallback {:.2f}%, max gap {} "
               "frame(s))",
               toString(verdict.status),
               jitter,
               rate,
               maxGap);
  return verdict;
}

GateVerdict QualityGates::filteringAdequacy(const FilterDecision& decision)
{
  GateVerdict verdict;
  verdict.gate = 3;
  verdict.name = "filtering_adequacy";
  verdict.metrics["cutoff_hz"] = decision.cutoffHz;
  verdict.metrics["search_min_hz"] = decision.fmin;
  verdict.metrics["search_max_hz"] = decision.fmax;
  verdict.metrics["failed"] = decision.failed ? 1.0 : 0.0;
  verdict.metrics["partial_channels"] = static_cast<double>(decision.partialChannels.size());
  verdict.metrics["excluded_channels"] =
    static_cast<double>(decision.excludedChannels.size());
  verdict.metrics["passthrough_channels"] =
    static_cast<double>(decision.passthroughChannels.size());
  verdict.notes.push_back("mode " + toString(decision.mode) + ", method " +
                          decision.method);
  std::vector<std::string> reasons;

  if (decision.failed)
  {
    reasons.push_back("REVIEW: Filter Failure - " +
                      (decision.failureReason.empty() ? std::string{"unspecified"}
                                                      : decision.failureReason));
  }
  else if (decision.cutoffHz >= decision.fmax - 1.0)
  {
    reasons.push_back(
      fmt::format("REVIEW: Filter at Maximum - cutoff = {:.1f} Hz", decision.cutoffHz));
  }

  if (!decision.excludedChannels.empty())
  {
    reasons.push_back(fmt::format("REVIEW: Unfiltered Channels - {} channel(s) "
                                  "have no finite span: {}",
                                  decision.excludedChannels.size(),
                                  join(decision.excludedChannels, ", ")));
  }
  if (!decision.partialChannels.empty())
  {
    reasons.push_back(fmt::format("REVIEW: Partially Filtered Channels - {} "
                                  "channel(s) contain NaN: {}",
                                  decision.partialChannels.size(),
                                  join(decision.partialChannels, ", ")));
  }
  if (!decision.passthroughChannels.empty())
  {
    reasons.push_back(fmt::format("REVIEW: Passthrough Channels - {} channel(s) "
                                  "left unfiltered near Nyquist",
                                  decision.passthroughChannels.size()));
  }

  if (!reasons.empty())
  {
    verdict.status = GateStatus::Review;
    verdict.reason = join(reasons, "; ");
  }

  spdlog::info("Gate 3: {} (cutoff {:.1f} Hz in [{:.0f}, {:.0f}] Hz, {} partial, "
               "{} excluded, {} passthrough)",
               toString(verdict.status),
               decision.cutoffHz,
               decision.fmin,
               decision.fmax,
               decision.partialChannels.size(),
               decision.excludedChannels.size(),
               decision.passthroughChannels.size());
  return verdict;
}

GateVerdict QualityGates::filteringAdequacy(const FilterDecision& decision,
                                            const SnrAnalysis::Report& snr)
{
  GateVerdict verdict = filteringAdequacy(decision);
  verdict.metrics["snr_mean_db"] = snr.meanDb;
  verdict.metrics["snr_min_db"] = snr.minDb;
  verdict.metrics["snr_joints_below_min"] = static_cast<double>(snr.failedJoints.size());
  verdict.notes.push_back(fmt::format("snr {:.1f} dB ({})", snr.meanDb, toString(snr.overall)));
  for (const auto& joint : snr.failedJoints)
  {
    verdict.notes.push_back("low snr on " + joint);
  }
  return verdict;
}

std::optional<std::string> QualityGates::eulerSequence(const std::string& jointName)
{
  std::string const name = toLower(jointName);
  if (contains(name, "forearm") || contains(name, "elbow"))
  {
    return "ZXY";
  }
  if (contains(name, "shoulder") || contains(name, "arm"))
  {
    return "YXY";
  }
  if (contains(name, "upleg") || contains(name, "thigh") || contains(name, "hip"))
  {
    return "ZXY";
  }
  if (contains(name, "knee") || contains(name, "leg"))
  {
    return "ZXY";
  }
  for (const char* trunk :
       {"pelvis", "spine", "neck", "head", "hand", "foot", "toe", "chest", "torso"})
  {
    if (contains(name, trunk))
    {
      return "ZXY";
    }
  }
  return std::nullopt;
}

std::vector<EulerAssignment> QualityGates::eulerAudit(
  const std::vector<std::string>& jointNames)
{
  std::vector<EulerAssignment> audit;
  audit.reserve(jointNames.size());
  for (const auto& joint : jointNames)
  {
    auto const sequence = eulerSequence(joint);
    audit.push_back(EulerAssignment{joint, sequence.value_or(kDefaultSequence),
                                    sequence.has_value()});
  }
  return audit;
}

GateVerdict QualityGates::mathematicalCompliance(
  const std::vector<std::string>& jointNames,
  double maxNormError,
  const Config& config)
{
  return mathematicalCompliance(jointNames, maxNormError, maxNormError,
                                BoneLengthQc::Report{}, config);
}

GateVerdict QualityGates::mathematicalCompliance(
  const std::vector<std::string>& jointNames,
  double sourceNormError,
  double correctedNormError,
  const BoneLengthQc::Report& bones,
  const Config& config)
{
  GateVerdict verdict;
  verdict.gate = 4;
  verdict.name = "mathematical_compliance";

  std::size_t nonCompliant = 0;
  for (const auto& entry : eulerAudit(jointNames))
  {
    if (!entry.compliant)
    {
      ++nonCompliant;
      verdict.notes.push_back(entry.jointName + " has no standard Euler sequence, "
                              "defaulting to " + entry.sequence);
    }
  }

  // A non-finite error on either side wins
  double maxNormError = sourceNormError;
  if (!std::isfinite(correctedNormError) ||
      (std::isfinite(sourceNormError) && correctedNormError > sourceNormError))
  {
    maxNormError = correctedNormError;
  }

  verdict.metrics["joints_audited"] = static_cast<double>(jointNames.size());
  verdict.metrics["joints_non_compliant"] = static_cast<double>(nonCompliant);
  verdict.metrics["max_norm_error"] = maxNormError;
  verdict.metrics["max_norm_error_before"] = sourceNormError;
  verdict.metrics["max_norm_error_after"] = correctedNormError;

  if (!bones.bones.empty())
  {
    verdict.metrics["bones_checked"] = static_cast<double>(bones.bones.size());
    verdict.metrics["bones_warn"] = static_cast<double>(bones.warnCount);
    verdict.metrics["bones_alert"] = static_cast<double>(bones.alertCount);
    verdict.metrics["bone_max_cv"] = bones.maxCv;
    for (const auto& flagged : bones.flaggedBones())
    {
      verdict.notes.push_back("bone length " + flagged);
    }
  }

  if (!std::isfinite(maxNormError) || maxNormError >= config.normErrorReject)
  {
    verdict.status = GateStatus::Reject;
    verdict.reason = fmt::format("REJECT: Quaternion Normalization - max error "
                                 "{:.4f} >= {:.2f}",
                                 maxNormError,
                                 config.normErrorReject);
  }
  else if (maxNormError >= config.normErrorReview)
  {
    verdict.status = GateStatus::Review;
    verdict.reason = fmt::format("REVIEW: Quaternion Normalization - max error "
                                 "{:.4f} >= {:.2f}",
                                 maxNormError,
                                 config.normErrorReview);
  }

  spdlog::info("Gate 4: {} (norm error {:.2e} before, {:.2e} after, {} "
               "non-compliant joint(s), {} bone alert(s))",
               toString(verdict.status),
               sourceNormError,
               correctedNormError,
               nonCompliant,
               bones.alertCount);
  return verdict;
}

}  // namespace mocap_core
