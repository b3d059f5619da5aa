// Ticket: 0020_snr_analysis

#ifndef MOCAP_CORE_SNR_ANALYSIS_HPP
#define MOCAP_CORE_SNR_ANALYSIS_HPP

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "mocap-core/src/DataTypes/MotionSession.hpp"

namespace mocap_core
{

enum class SnrQuality
{
  Excellent,   // >= 30 dB
  Good,        // >= 20 dB
  Acceptable,  // >= 15 dB
  Poor,        // >= 10 dB
  Reject,
  Unknown  // not enough finite samples
};

[[nodiscard]] std::string toString(SnrQuality quality);

struct JointSnr
{
  std::string jointName;
  std::array<double, 3> axisDb{};  // x, y, z
  double meanDb{0.0};              // NaN-ignoring mean of the axes
  double minDb{0.0};
  SnrQuality quality{SnrQuality::Unknown};
};

/**
 * @brief Signal-to-noise ratio of the position low-pass filter
 *
 * The filtered signal is taken as signal and the residual raw - filtered as
 * noise: SNR = 10 log10(mean(filtered^2) / mean(residual^2)) over the
 * samples finite in both series. A residual power below 1e-12 reports
 * 100 dB. Fewer than ten finite samples give NaN.
 *
 * The report is advisory: it is shown on Gate 3 but never changes its
 * status.
 *
 * @ticket 0020_snr_analysis
 */
class SnrAnalysis
{
public:
  struct Config
  {
    double minAcceptableDb{15.0};
    std::size_t minSamples{10};
  };

  struct Report
  {
    std::vector<JointSnr> joints;
    double meanDb{0.0};  // NaN when no joint has a finite SNR
    double minDb{0.0};
    double maxDb{0.0};
    SnrQuality overall{SnrQuality::Unknown};
    std::vector<std::string> failedJoints;  // meanDb below minAcceptableDb
  };

  /**
   * @throws std::invalid_argument if the series lengths differ
   */
  [[nodiscard]] static double fromResiduals(std::span<const double> raw,
                                            std::span<const double> filtered,
                                            const Config& config);

  [[nodiscard]] static double fromResiduals(std::span<const double> raw,
                                            std::span<const double> filtered);

  [[nodiscard]] static SnrQuality assess(double snrDb);

  /**
   * @brief Per-joint SNR of every position axis
   *
   * @throws std::invalid_argument if the sessions differ in joint or frame
   *         count
   */
  [[nodiscard]] static Report perJoint(const MotionSession& raw,
                                       const MotionSession& filtered,
                                       const Config& config);

  [[nodiscard]] static Report perJoint(const MotionSession& raw,
                                       const MotionSession& filtered);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_SNR_ANALYSIS_HPP
