// Ticket: 0009_adaptive_cutoff

#ifndef MOCAP_CORE_CUTOFF_SELECTOR_HPP
#define MOCAP_CORE_CUTOFF_SELECTOR_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "mocap-core/src/DataTypes/StageResult.hpp"
#include "mocap-core/src/Filtering/BodyRegion.hpp"

namespace mocap_core
{

/**
 * @brief Residual analysis of one signal over a range of cutoffs
 */
struct ResidualAnalysis
{
  double cutoffHz{0.0};     // after guardrails
  double rawCutoffHz{0.0};  // before the fmax check and guardrails
  std::string method;       // strict_knee, relaxed_knee, ... fmax_fallback
  bool kneePointFound{false};
  bool guardrailApplied{false};
  double guardrailDeltaHz{0.0};

  std::vector<double> testFrequencies;  // [Hz]
  std::vector<double> residualRms;      // same units as the signal
  double rangeRatio{0.0};
  bool curveIsFlat{false};
  double residualRmsFinal{0.0};
  double residualSlope{0.0};

  std::optional<double> strictKneeHz;
  std::optional<double> relaxedKneeHz;
  std::optional<double> diminishingHz;     // after the 4 Hz floor
  std::optional<double> rawDiminishingHz;  // before the floor

  BodyRegion region{BodyRegion::UpperDistal};
  std::string failureReason;  // empty when the selection is trusted

  [[nodiscard]] bool failed() const
  {
    return !failureReason.empty();
  }
};

/**
 * @brief Winter residual analysis for low-pass cutoff selection
 *
 * The detrended signal is filtered at every integer cutoff in [fmin, fmax]
 * (cutoffs at or above Nyquist are skipped) and the RMS of the residual is
 * recorded. A knee of the residual curve is located by three heuristics:
 *
 * - strict knee: first cutoff with rms <= 1.05 * floor
 * - relaxed knee: first cutoff with rms <= 1.10 * floor
 * - steepest relative drop, floored at 4 Hz and ignored above 10 Hz
 *
 * Knee heuristics are disabled for a flat curve (relative range < 15 %).
 * The lowest candidate wins, except that a steepest-drop candidate below
 * the region minimum is blended 0.3 / 0.7 with a higher knee. Without
 * candidates the region maximum is used. A result within 1 Hz of fmax is
 * a failure ("fmax_fallback").
 *
 * Result states:
 * - Failed("flat_signal") when the signal has no variation
 * - Degraded(analysis, reason) when a value exists but is not trusted
 * - Success(analysis) otherwise
 *
 * @ticket 0009_adaptive_cutoff
 */
class CutoffSelector
{
public:
  struct Config
  {
    int fmin{1};   // [Hz]
    int fmax{16};  // [Hz]
    BodyRegion region{BodyRegion::UpperDistal};
    std::optional<double> minCutoff;  // biomechanical guardrail [Hz]
    // Report the raw knee (strict, then relaxed) without blending
    bool validationMode{false};
  };

  static constexpr double kFlatSignalStd = 1e-10;
  static constexpr double kFlatCurveRatio = 0.15;
  static constexpr double kStrictKneeFactor = 1.05;
  static constexpr double kRelaxedKneeFactor = 1.10;
  static constexpr double kMinRelativeDrop = 0.05;
  static constexpr double kDropFloorHz = 4.0;
  static constexpr double kDropCeilingHz = 10.0;
  static constexpr double kDropWeight = 0.3;
  static constexpr double kKneeWeight = 0.7;
  static constexpr double kGuardrailReportDelta = 2.0;

  /**
   * @brief Select a cutoff for one signal
   *
   * @param signal Finite samples (at least two)
   * @param fs Sampling rate [Hz]
   * @param config Search range, region and guardrail
   * @throws std::invalid_argument on short or non-finite input or fs <= 0
   */
  [[nodiscard]] static StageResult<ResidualAnalysis> analyze(
    std::span<const double> signal,
    double fs,
    const Config& config);

  /**
   * @brief Residual RMS of the detrended signal at each cutoff
   *
   * @return One rms value per cutoff
   */
  [[nodiscard]] static std::vector<double> residualCurve(
    std::span<const double> detrended,
    double fs,
    std::span<const double> cutoffs);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_CUTOFF_SELECTOR_HPP
