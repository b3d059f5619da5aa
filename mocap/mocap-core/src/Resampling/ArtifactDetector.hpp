// Ticket: 0006_temporal_resampler

#ifndef MOCAP_CORE_ARTIFACT_DETECTOR_HPP
#define MOCAP_CORE_ARTIFACT_DETECTOR_HPP

#include <cstddef>
#include <span>
#include <vector>

#include <Eigen/Dense>

namespace mocap_core
{

/**
 * @brief Velocity-spike detection on position channels
 *
 * Per axis, velocity is the finite difference of position over time. The
 * noise scale is a robust sigma (1.4826 * MAD, the normal-equivalent scale),
 * floored so that a stationary joint with near-zero MAD is not masked
 * wholesale. A sample is an artifact when |v| exceeds thresholdSigma robust
 * sigmas. The per-axis mask is dilated by dilationFrames on each side to
 * capture the ramp in and out of a spike, then OR-ed across axes.
 *
 * @ticket 0006_temporal_resampler
 */
class ArtifactDetector
{
public:
  struct Config
  {
    double thresholdSigma{6.0};
    double sigmaFloor{1e-6};   // [mm/s]
    int dilationFrames{1};
    double minTimeStep{1e-9};  // [s], guards dt == 0
  };

  struct Detection
  {
    std::vector<bool> mask;                // true where the frame is an artifact
    std::size_t artifactFrames{0};
    Eigen::Vector3d robustSigma{Eigen::Vector3d::Zero()};  // per axis [mm/s]
  };

  /**
   * @brief Detect velocity artifacts in one joint's positions
   *
   * NaN samples are never flagged and do not contribute to the scale.
   *
   * @param times Timestamps [s]
   * @param positions One row per frame [mm]
   * @param config Detection thresholds
   * @throws std::invalid_argument if sizes differ
   */
  [[nodiscard]] static Detection detect(std::span<const double> times,
                                        const Eigen::MatrixX3d& positions,
                                        const Config& config);

  /**
   * @brief Dilate a boolean mask by radius frames on both sides
   */
  [[nodiscard]] static std::vector<bool> dilate(const std::vector<bool>& mask,
                                                int radius);

  /**
   * @brief Copy of positions with masked rows set to NaN
   */
  [[nodiscard]] static Eigen::MatrixX3d applyMask(
    const Eigen::MatrixX3d& positions,
    const std::vector<bool>& mask);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_ARTIFACT_DETECTOR_HPP
