// Ticket: 0012_kinematics_derivation

#ifndef MOCAP_CORE_ANGULAR_VELOCITY_ESTIMATOR_HPP
#define MOCAP_CORE_ANGULAR_VELOCITY_ESTIMATOR_HPP

#include <span>
#include <string>

#include <Eigen/Dense>

#include "mocap-core/src/DataTypes/Quaternion.hpp"

namespace mocap_core
{

enum class RotationFrame
{
  Local,  // body frame, dq = q_t^-1 * q_{t+1}
  Global  // world frame, dq = q_{t+1} * q_t^-1
};

/**
 * @brief Agreement and noise of the three estimators on one sequence
 *
 * Noise is the standard deviation of the second difference of |omega|.
 * Ratios are advisory telemetry and never gate a run.
 */
struct EstimatorComparison
{
  Eigen::MatrixX3d quaternionLog;
  Eigen::MatrixX3d fivePoint;
  Eigen::MatrixX3d central;

  double meanMagnitudeLog{0.0};
  double meanMagnitudeFivePoint{0.0};
  double meanMagnitudeCentral{0.0};
  double noiseLog{0.0};
  double noiseFivePoint{0.0};
  double noiseCentral{0.0};
  double agreementLogFivePoint{0.0};  // mean |omega_log - omega_5pt|
  double agreementLogCentral{0.0};
  double noiseReductionFivePoint{0.0};  // noiseCentral / noiseFivePoint
  double noiseReductionLog{0.0};        // noiseCentral / noiseLog
  std::string recommendation;
};

/**
 * @brief Angular velocity from orientation sequences [rad/s]
 *
 * All estimators work on a uniform grid with step dt and return one row per
 * sample. The quaternion log map is the production estimator; the central
 * difference and five-point stencil exist for validation.
 *
 * @ticket 0012_kinematics_derivation
 */
class AngularVelocityEstimator
{
public:
  static constexpr double kFivePointWeights[5] = {0.1, 0.25, 0.3, 0.25, 0.1};

  /**
   * @brief omega_t = rotvec(dq_t) / dt with a hemisphere-fixed dq
   *
   * The last sample repeats the previous one. Pairs containing NaN give NaN.
   *
   * @throws std::invalid_argument if dt <= 0
   */
  [[nodiscard]] static Eigen::MatrixX3d quaternionLog(
    std::span<const QuaternionD> q,
    double dt,
    RotationFrame frame);

  /**
   * @brief rotvec(q_{t-1}^-1 q_{t+1}) / (2 dt), one-sided at the boundaries
   */
  [[nodiscard]] static Eigen::MatrixX3d centralDifference(
    std::span<const QuaternionD> q,
    double dt,
    RotationFrame frame);

  /**
   * @brief Weighted average of the five forward log-map rates around t
   *
   * Samples without five forward rates use the simple estimate.
   */
  [[nodiscard]] static Eigen::MatrixX3d fivePoint(std::span<const QuaternionD> q,
                                                  double dt,
                                                  RotationFrame frame);

  [[nodiscard]] static EstimatorComparison compare(
    std::span<const QuaternionD> q,
    double dt,
    RotationFrame frame);

  // Rate between two samples, NaN if either is missing
  [[nodiscard]] static Eigen::Vector3d simpleRate(const QuaternionD& q0,
                                                  const QuaternionD& q1,
                                                  double dt,
                                                  RotationFrame frame);

  // Row norms
  [[nodiscard]] static Eigen::VectorXd magnitude(const Eigen::MatrixX3d& omega);

  // std of the second difference of |omega|
  [[nodiscard]] static double noiseMetric(const Eigen::MatrixX3d& omega);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_ANGULAR_VELOCITY_ESTIMATOR_HPP
