// Ticket: 0005_quaternion_drift_monitor

#ifndef MOCAP_CORE_DRIFT_MONITOR_HPP
#define MOCAP_CORE_DRIFT_MONITOR_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>

#include "mocap-core/src/DataTypes/Quaternion.hpp"

namespace mocap_core
{

/**
 * @brief Quality class of the worst | |q| - 1 | in a sequence
 */
enum class DriftStatus
{
  Excellent,   // < 1e-6
  Good,        // < 1e-3
  Acceptable,  // < 1e-2
  Poor         // >= 1e-2
};

enum class IntegrityStatus
{
  Pass,
  Warn,
  Fail
};

[[nodiscard]] std::string toString(DriftStatus status);
[[nodiscard]] std::string toString(IntegrityStatus status);

/**
 * @brief Detects, validates and corrects quaternion normalization drift
 *
 * Long captures accumulate norm error through repeated interpolation and
 * composition. Drift is measured as | |q| - 1 | per sample.
 *
 * @ticket 0005_quaternion_drift_monitor
 */
class DriftMonitor
{
public:
  struct Config
  {
    double driftThreshold{0.01};  // Per-frame error counted as drifted
    double correctionThreshold{0.01};  // Max error above which correction is required
  };

  struct DriftReport
  {
    double maxNormError{0.0};
    double meanNormError{0.0};
    double stdNormError{0.0};
    std::size_t driftFrameCount{0};
    double driftPercentage{0.0};
    DriftStatus status{DriftStatus::Excellent};
    bool requiresCorrection{false};

    // Endpoint drift rate [1/s], when timestamps are supplied
    std::optional<double> driftRatePerSecond;

    // Least-squares trend of the error over time [1/s] (> 10 samples)
    std::optional<double> temporalTrend;
  };

  struct IntegrityReport
  {
    IntegrityStatus status{IntegrityStatus::Pass};
    std::string reason;
    bool hasNonFinite{false};
    bool normalizationOk{true};
    bool continuityOk{true};
    std::size_t discontinuities{0};
    double minDotProduct{1.0};
    DriftReport drift;
  };

  struct CorrectionResult
  {
    QuaternionSeries corrected;
    IntegrityReport before;
    IntegrityReport after;
    std::size_t framesCorrected{0};
    double residualErrorAfter{0.0};

    [[nodiscard]] bool successful() const
    {
      return after.status != IntegrityStatus::Fail;
    }
  };

  /**
   * @brief Measure normalization drift over a sequence
   *
   * Non-finite samples are ignored for the statistics.
   *
   * @param series Quaternion sequence
   * @param times Optional timestamps [s], same length as series
   * @param config Thresholds
   */
  [[nodiscard]] static DriftReport analyze(std::span<const QuaternionD> series,
                                           std::span<const double> times,
                                           const Config& config);

  // Default thresholds
  [[nodiscard]] static DriftReport analyze(std::span<const QuaternionD> series,
                                           std::span<const double> times = {});

  /**
   * @brief Combined NaN, normalization and continuity check
   *
   * Strict: max norm error < 1e-3 and no discontinuities.
   * Relaxed: max norm error < 1e-2 and fewer than 1% discontinuities.
   * Both OK gives Pass, one of them gives Warn, neither gives Fail.
   * Any non-finite component gives Fail immediately.
   */
  [[nodiscard]] static IntegrityReport validate(
    std::span<const QuaternionD> series,
    std::span<const double> times = {},
    bool strict = true);

  /**
   * @brief Renormalize then re-enforce continuity, validating before and after
   */
  [[nodiscard]] static CorrectionResult correct(
    std::span<const QuaternionD> series,
    std::span<const double> times = {});
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_DRIFT_MONITOR_HPP
