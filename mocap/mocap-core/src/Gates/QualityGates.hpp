// Ticket: 0014_quality_gates

#ifndef MOCAP_CORE_QUALITY_GATES_HPP
#define MOCAP_CORE_QUALITY_GATES_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "mocap-core/src/Calibration/CalibrationEngine.hpp"
#include "mocap-core/src/DataTypes/StageResult.hpp"
#include "mocap-core/src/Filtering/PositionFilter.hpp"
#include "mocap-core/src/Filtering/SnrAnalysis.hpp"
#include "mocap-core/src/Gates/BoneLengthQc.hpp"
#include "mocap-core/src/Gates/GateVerdict.hpp"
#include "mocap-core/src/Resampling/InterpolationLog.hpp"

namespace mocap_core
{

/**
 * @brief Euler sequence assigned to one joint for reporting
 */
struct EulerAssignment
{
  std::string jointName;
  std::string sequence;  // e.g. "ZXY"
  bool compliant{false};
};

/**
 * @brief Gates 1 to 4 as pure functions of stage artifacts
 *
 * Gate 1 (calibration integrity) turns a fallback reference window or a
 * failed identity validation into REVIEW. Gate 2 (temporal integrity) looks
 * at clock jitter of the source stream and at the interpolation fallbacks.
 * Gate 3 (filtering adequacy) inspects the filter decision, including
 * channels that were only partly filtered or not filtered at all. Gate 4
 * (mathematical compliance) audits the Euler sequences and the quaternion
 * normalization error; only the latter decides its status, non-compliant
 * joints are reported as notes.
 *
 * The SNR report on Gate 3 and the bone-length report on Gate 4 add metrics
 * and notes only.
 *
 * @ticket 0014_quality_gates
 */
class QualityGates
{
public:
  struct Config
  {
    double jitterReviewMs{2.0};
    double fallbackReviewPercent{5.0};
    double fallbackRejectPercent{15.0};
    double normErrorReview{0.01};
    double normErrorReject{0.05};
  };

  /**
   * @brief Gate 1
   *
   * REJECT when calibration failed, REVIEW when it is degraded, the window
   * came from the minimum-motion fallback or a joint failed validation.
   */
  [[nodiscard]] static GateVerdict calibrationIntegrity(
    const StageResult<CalibrationResult>& calibration);

  /**
   * @brief Gate 2
   *
   * Fallback rate is 100 * (frames interpolated on joints with a fallback) /
   * totalFrames.
   *
   * @param sourceTimes Raw timestamps before resampling [s]
   * @param log Interpolation audit trail
   * @param totalFrames Frame count used as denominator of the fallback rate
   */
  [[nodiscard]] static GateVerdict temporalIntegrity(std::span<const double> sourceTimes,
                                                     const InterpolationLog& log,
                                                     std::size_t totalFrames,
                                                     const Config& config);

  /**
   * @brief Gate 3
   *
   * REVIEW when cutoff selection failed, the cutoff sits at the search
   * ceiling, or any channel was excluded, partly filtered or passed through.
   */
  [[nodiscard]] static GateVerdict filteringAdequacy(const FilterDecision& decision);

  // Gate 3 with the per-joint SNR attached as metrics and notes
  [[nodiscard]] static GateVerdict filteringAdequacy(const FilterDecision& decision,
                                                     const SnrAnalysis::Report& snr);

  /**
   * @brief Gate 4
   *
   * @param jointNames Skeleton joint names
   * @param maxNormError Worst | |q| - 1 | over the session
   */
  [[nodiscard]] static GateVerdict mathematicalCompliance(
    const std::vector<std::string>& jointNames,
    double maxNormError,
    const Config& config);

  /**
   * @brief Gate 4 with the normalization error before and after correction
   *
   * The status follows the larger of the two errors, so unit-norm drift in
   * the source is reported even though the conditioned output is
   * renormalized. Bone-length statistics are attached as metrics and notes.
   *
   * @param sourceNormError Worst | |q| - 1 | of the input orientations
   * @param correctedNormError Worst | |q| - 1 | after drift correction
   */
  [[nodiscard]] static GateVerdict mathematicalCompliance(
    const std::vector<std::string>& jointNames,
    double sourceNormError,
    double correctedNormError,
    const BoneLengthQc::Report& bones,
    const Config& config);

  // Standard Euler sequence for a joint name, empty for unknown joints
  [[nodiscard]] static std::optional<std::string> eulerSequence(
    const std::string& jointName);

  [[nodiscard]] static std::vector<EulerAssignment> eulerAudit(
    const std::vector<std::string>& jointNames);

  // std(diff(times)) in milliseconds, NaN for fewer than two samples
  [[nodiscard]] static double jitterMs(std::span<const double> times);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_QUALITY_GATES_HPP
