// Ticket: 0009_adaptive_cutoff

#include "mocap-core/src/Filtering/CutoffSelector.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "mocap-core/src/Filtering/ButterworthFilter.hpp"
#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{

constexpr double kRatioEpsilon = 1e-10;

struct Candidate
{
  double cutoff;
  std::string method;
};

std::optional<double> findCandidate(const std::vector<Candidate>& candidates,
                                    const std::string& method)
{
  auto it = std::find_if(candidates.begin(),
                         candidates.end(),
                         [&method](const Candidate& c)
                         { return c.method == method; });
  if (it == candidates.end())
  {
    return std::nullopt;
  }
  return it->cutoff;
}

double roundToTenth(double value)
{
  return std::round(value * 10.0) / 10.0;
}

}  // namespace

std::vector<double> CutoffSelector::residualCurve(
  std::span<const double> detrended,
  double fs,
  std::span<const double> cutoffs)
{
  std::vector<double> rmsValues;
  rmsValues.reserve(cutoffs.size());
  std::vector<double> residual(detrended.size());
  for (double const fc : cutoffs)
  {
    auto const filtered = ButterworthFilter::lowpass(detrended, fc, fs);
    for (std::size_t i = 0; i < detrended.size(); ++i)
    {
      residual[i] = detrended[i] - filtered[i];
    }
    rmsValues.push_back(stats::rms(residual));
  }
  return rmsValues;
}

StageResult<ResidualAnalysis> CutoffSelector::analyze(
  std::span<const double> signal,
  double fs,
  const Config& config)
{
  if (signal.size() < 2)
  {
    throw std::invalid_argument{
      "CutoffSelector: at least two samples are required"};
  }
  if (!(fs > 0.0) || config.fmin < 1 || config.fmax < config.fmin)
  {
    throw std::invalid_argument{"CutoffSelector: invalid rate or search range"};
  }
  if (!std::all_of(signal.begin(),
                   signal.end(),
                   [](double v) { return std::isfinite(v); }))
  {
    throw std::invalid_argument{"CutoffSelector: signal contains NaN or Inf"};
  }

  double const mu = stats::mean(signal);
  std::vector<double> x(signal.begin(), signal.end());
  for (double& v : x)
  {
    v -= mu;
  }

  double const sigma = stats::stddev(x);
  if (sigma < kFlatSignalStd)
  {
    spdlog::warn("CutoffSelector: signal has no variation (std={:.2e})", sigma);
    return StageResult<ResidualAnalysis>::failed("flat_signal");
  }

  std::vector<double> cutoffs;
  for (int fc = config.fmin; fc <= config.fmax; ++fc)
  {
    if (static_cast<double>(fc) < 0.5 * fs)
    {
      cutoffs.push_back(static_cast<double>(fc));
    }
  }
  if (cutoffs.empty())
  {
    spdlog::warn("CutoffSelector: no cutoff in [{}, {}] Hz lies below Nyquist "
                 "at {} Hz",
                 config.fmin,
                 config.fmax,
                 fs);
    return StageResult<ResidualAnalysis>::failed("no_cutoff_below_nyquist");
  }
  double const fmaxEffective = cutoffs.back();

  ResidualAnalysis result;
  result.region = config.region;
  result.testFrequencies = cutoffs;
  result.residualRms = residualCurve(x, fs, cutoffs);
  const auto& rmsValues = result.residualRms;
  std::size_t const n = rmsValues.size();

  double const floor = rmsValues.back();
  double const ceiling = rmsValues.front();
  result.rangeRatio = (ceiling - floor) / (ceiling + kRatioEpsilon);
  result.curveIsFlat = result.rangeRatio < kFlatCurveRatio;

  auto firstBelow = [&](double factor) -> std::optional<std::size_t>
  {
    for (std::size_t i = 0; i < n; ++i)
    {
      if (rmsValues[i] <= factor * floor)
      {
        return i;
      }
    }
    return std::nullopt;
  };

  // Largest relative drop between consecutive cutoffs
  std::size_t dropIdx = 0;
  double maxDrop = 0.0;
  for (std::size_t i = 0; i + 1 < n; ++i)
  {
    double const drop = std::abs((rmsValues[i + 1] - rmsValues[i]) /
                                 (rmsValues[i] + kRatioEpsilon));
    if (i == 0 || drop > maxDrop)
    {
      maxDrop = drop;
      dropIdx = i + 1;
    }
  }
  if (n > 1)
  {
    result.rawDiminishingHz = cutoffs[dropIdx];
  }

  std::vector<Candidate> candidates;
  bool kneePointFound = false;
  if (!result.curveIsFlat)
  {
    if (auto idx = firstBelow(kStrictKneeFactor))
    {
      candidates.push_back({cutoffs[*idx], "strict_knee"});
      kneePointFound = true;
    }
    if (auto idx = firstBelow(kRelaxedKneeFactor))
    {
      candidates.push_back({cutoffs[*idx], "relaxed_knee"});
      kneePointFound = true;
    }
  }
  if (n > 1 && maxDrop > kMinRelativeDrop)
  {
    double const diminishing = std::max(kDropFloorHz, cutoffs[dropIdx]);
    if (diminishing <= kDropCeilingHz)
    {
      candidates.push_back({diminishing, "diminishing_returns"});
      kneePointFound = true;
    }
  }

  result.strictKneeHz = findCandidate(candidates, "strict_knee");
  result.relaxedKneeHz = findCandidate(candidates, "relaxed_knee");
  result.diminishingHz = findCandidate(candidates, "diminishing_returns");

  double cutoff = 0.0;
  std::string method;
  RegionProfile const profile = profileOf(config.region);

  if (!candidates.empty())
  {
    std::stable_sort(candidates.begin(),
                     candidates.end(),
                     [](const Candidate& a, const Candidate& b)
                     { return a.cutoff < b.cutoff; });

    if (config.validationMode)
    {
      if (result.strictKneeHz)
      {
        cutoff = *result.strictKneeHz;
        method = "validation_strict_knee";
      }
      else if (result.relaxedKneeHz)
      {
        cutoff = *result.relaxedKneeHz;
        method = "validation_relaxed_knee";
      }
      else
      {
        cutoff = candidates.front().cutoff;
        method = "validation_raw_" + candidates.front().method;
      }
    }
    else
    {
      auto const knee =
        result.strictKneeHz ? result.strictKneeHz : result.relaxedKneeHz;
      auto const drop = result.diminishingHz;
      if (drop && knee && *drop < profile.rangeMin && *knee > *drop)
      {
        cutoff = roundToTenth(kDropWeight * *drop + kKneeWeight * *knee);
        method = fmt::format("weighted_compromise({:.1f}*{}+{:.1f}*{})",
                             *drop,
                             kDropWeight,
                             *knee,
                             kKneeWeight);
        spdlog::info("CutoffSelector: {} drop {:.1f} Hz below region minimum "
                     "{:.1f} Hz, knee {:.1f} Hz, compromise {:.1f} Hz",
                     toString(config.region),
                     *drop,
                     profile.rangeMin,
                     *knee,
                     cutoff);
      }
      else
      {
        cutoff = candidates.front().cutoff;
        method = candidates.front().method;
      }
    }
  }
  else
  {
    cutoff = profile.rangeMax;
    method = "no_knee_point_fallback_" + toString(config.region);
    kneePointFound = false;
    spdlog::warn("CutoffSelector: no knee point for {} (range ratio {:.1f}%), "
                 "using region fallback {:.1f} Hz",
                 toString(config.region),
                 100.0 * result.rangeRatio,
                 cutoff);
  }

  result.rawCutoffHz = cutoff;

  if (cutoff >= fmaxEffective - 1.0)
  {
    cutoff = fmaxEffective;
    method = "fmax_fallback";
    kneePointFound = false;
  }

  if (config.minCutoff)
  {
    double const original = cutoff;
    cutoff = std::max(cutoff, *config.minCutoff);
    result.guardrailDeltaHz = cutoff - original;
    result.guardrailApplied = cutoff > original;
    if (result.guardrailApplied)
    {
      spdlog::warn("CutoffSelector: guardrail clamps {:.1f} Hz to {:.1f} Hz "
                   "for {} (+{:.1f} Hz)",
                   original,
                   cutoff,
                   toString(config.region),
                   result.guardrailDeltaHz);
    }
  }

  result.cutoffHz = cutoff;
  result.method = method;
  result.kneePointFound = kneePointFound;

  // Residual at the cutoff nearest to the selection
  std::size_t nearest = 0;
  for (std::size_t i = 1; i < n; ++i)
  {
    if (std::abs(cutoffs[i] - cutoff) < std::abs(cutoffs[nearest] - cutoff))
    {
      nearest = i;
    }
  }
  result.residualRmsFinal = rmsValues[nearest];
  if (n > 1)
  {
    if (nearest == 0)
    {
      result.residualSlope = rmsValues[1] - rmsValues[0];
    }
    else if (nearest == n - 1)
    {
      result.residualSlope = rmsValues[n - 1] - rmsValues[n - 2];
    }
    else
    {
      result.residualSlope =
        (rmsValues[nearest + 1] - rmsValues[nearest - 1]) / 2.0;
    }
  }

  if (result.method == "fmax_fallback")
  {
    result.failureReason =
      fmt::format("fmax_fallback: cutoff at {:.0f} Hz, residual did not "
                  "plateau in {}-{:.0f} Hz",
                  result.cutoffHz,
                  config.fmin,
                  fmaxEffective);
  }
  else if (!kneePointFound && result.curveIsFlat)
  {
    result.failureReason =
      fmt::format("RMS curve is flat (range {:.1f}%), no knee point in "
                  "{}-{:.0f} Hz",
                  100.0 * result.rangeRatio,
                  config.fmin,
                  fmaxEffective);
  }
  else if (!kneePointFound)
  {
    result.failureReason =
      fmt::format("no knee point found, using {} cutoff", result.method);
  }
  else if (result.guardrailApplied &&
           result.guardrailDeltaHz >= kGuardrailReportDelta)
  {
    result.failureReason =
      fmt::format("guardrail override +{:.1f} Hz from {:.1f} Hz to {:.1f} Hz",
                  result.guardrailDeltaHz,
                  result.cutoffHz - result.guardrailDeltaHz,
                  result.cutoffHz);
  }

  spdlog::debug("CutoffSelector: {} cutoff {:.1f} Hz ({})",
                toString(config.region),
                result.cutoffHz,
                result.method);

  if (result.failed())
  {
    std::string reason = result.failureReason;
    return StageResult<ResidualAnalysis>::degraded(std::move(result),
                                                   std::move(reason));
  }
  return StageResult<ResidualAnalysis>::success(std::move(result));
}

}  // namespace mocap_core
