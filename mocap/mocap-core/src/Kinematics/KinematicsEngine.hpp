// Ticket: 0012_kinematics_derivation

#ifndef MOCAP_CORE_KINEMATICS_ENGINE_HPP
#define MOCAP_CORE_KINEMATICS_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mocap-core/src/Calibration/ReferenceWindowDetector.hpp"
#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/Kinematics/AngularVelocityEstimator.hpp"

namespace mocap_core
{

/**
 * @brief Derived kinematics of one joint, one row per frame
 *
 * Angular quantities are in degrees, linear quantities in mm.
 */
struct JointKinematics
{
  JointIndex joint{0};
  std::string jointName;

  QuaternionSeries localOrientation;   // parent-relative, hemisphere-continuous
  QuaternionD referenceLocal;          // mean local orientation in the window
  QuaternionSeries zeroedOrientation;  // referenceLocal^-1 * localOrientation
  Eigen::MatrixX3d rotationVectorDeg;
  Eigen::MatrixX3d angularVelocityDeg;      // [deg/s]
  Eigen::MatrixX3d angularAccelerationDeg;  // [deg/s^2]

  Eigen::MatrixX3d linearVelocity;      // world [mm/s]
  Eigen::MatrixX3d linearAcceleration;  // world [mm/s^2]
  Eigen::MatrixX3d rootRelativePosition;      // [mm]
  Eigen::MatrixX3d rootRelativeVelocity;      // [mm/s]
  Eigen::MatrixX3d rootRelativeAcceleration;  // [mm/s^2]
};

/**
 * @brief Kinematics of a whole session plus the settings that produced it
 */
struct KinematicsResult
{
  std::vector<double> times;
  double samplingRate{0.0};  // [Hz]
  std::size_t sgWindow{0};
  int sgPolyorder{3};
  RotationFrame frame{RotationFrame::Local};
  std::vector<JointKinematics> joints;  // skeleton order

  [[nodiscard]] std::optional<std::size_t> indexOf(const std::string& jointName) const;
};

/**
 * @brief Parent-relative joint kinematics referenced to a calibration window
 *
 * Joints are walked parent-before-child. The local orientation of a child is
 * q_parent^-1 * q_child; the root keeps its world orientation. The reference
 * local orientation is the Markley mean of the local orientations inside the
 * calibration window, so a joint held in the calibration pose reads zero.
 *
 * Angular velocity uses the quaternion log map; angular acceleration and all
 * linear derivatives use the Savitzky-Golay differentiator.
 *
 * @ticket 0012_kinematics_derivation
 */
class KinematicsEngine
{
public:
  struct Config
  {
    double sgWindowSeconds{0.175};
    int sgPolyorder{3};
    RotationFrame frame{RotationFrame::Local};
  };

  /**
   * @brief Derive kinematics for every joint
   *
   * @param session Uniformly sampled, filtered session
   * @param window Calibration reference window
   * @param samplingRate Grid rate [Hz]
   * @param config Differentiator settings
   * @throws std::invalid_argument on a non-positive rate, an empty window or
   *         a session too short for the smoothing window
   * @throws std::runtime_error if the skeleton has no root
   */
  [[nodiscard]] static KinematicsResult compute(const MotionSession& session,
                                                const ReferenceWindow& window,
                                                double samplingRate,
                                                const Config& config);

  [[nodiscard]] static KinematicsResult compute(const MotionSession& session,
                                                const ReferenceWindow& window,
                                                double samplingRate);

  /**
   * @brief Parent-relative orientations, continuity enforced
   *
   * Result is indexed by JointIndex.
   */
  [[nodiscard]] static std::vector<QuaternionSeries> localOrientations(
    const MotionSession& session);

  /**
   * @brief Markley mean of the finite samples in [startFrame, endFrame)
   *
   * Identity when the window holds no finite sample.
   */
  [[nodiscard]] static QuaternionD referenceOrientation(
    const QuaternionSeries& series,
    const ReferenceWindow& window);

  // referenceLocal^-1 * q for every sample
  [[nodiscard]] static QuaternionSeries zeroed(const QuaternionSeries& local,
                                               const QuaternionD& referenceLocal);

  // Rotation vectors in degrees, w >= 0 hemisphere
  [[nodiscard]] static Eigen::MatrixX3d rotationVectorsDeg(
    const QuaternionSeries& series);

  // Largest finite row norm, 0 when none
  [[nodiscard]] static double maxRowNorm(const Eigen::MatrixX3d& values);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_KINEMATICS_ENGINE_HPP
