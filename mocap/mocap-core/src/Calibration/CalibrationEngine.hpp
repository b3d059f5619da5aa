// Ticket: 0011_anatomical_calibration

#ifndef MOCAP_CORE_CALIBRATION_ENGINE_HPP
#define MOCAP_CORE_CALIBRATION_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mocap-core/src/Calibration/PoseCorrection.hpp"
#include "mocap-core/src/Calibration/ReferenceWindowDetector.hpp"
#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/DataTypes/StageResult.hpp"

namespace mocap_core
{

/**
 * @brief Static offset of one joint: offset * q is close to identity in the window
 */
struct CalibrationOffset
{
  JointIndex joint{0};
  std::string jointName;
  QuaternionD offset;     // inverse of the reference orientation
  QuaternionD reference;  // Markley mean over the window, w >= 0
  std::size_t samples{0};
};

struct JointResidual
{
  std::string jointName;
  double medianResidualDeg{0.0};
  double maxResidualDeg{0.0};
  double offsetAngleDeg{0.0};
  bool passed{false};
};

struct CalibrationValidation
{
  double toleranceDeg{1.0};
  std::vector<JointResidual> joints;
  bool passed{false};
  std::vector<std::string> failedJoints;
};

/**
 * @brief Advisory anatomical check of a shoulder after calibration
 *
 * Euler angles are intrinsic XYZ of pose * offset * q, in degrees. The
 * deviation score is the norm of the mean angles (distance from neutral).
 */
struct AnatomyCheck
{
  std::string jointName;
  Eigen::Vector3d eulerMeanDeg{Eigen::Vector3d::Zero()};
  Eigen::Vector3d eulerMedianDeg{Eigen::Vector3d::Zero()};
  double deviationScore{0.0};
  bool poseCorrectionApplied{false};
};

struct CalibrationResult
{
  std::vector<CalibrationOffset> offsets;
  ReferenceWindow window;  // provenance
  PoseCorrectionResult pose;
  CalibrationValidation validation;
  std::vector<AnatomyCheck> anatomy;

  [[nodiscard]] std::optional<CalibrationOffset> offsetFor(
    JointIndex joint) const;
};

/**
 * @brief Anatomical calibration from a static reference window
 *
 * Four steps: locate the window, measure arm elevation (stored separately,
 * never baked into the offsets), compute per-joint offsets as the inverse of
 * the Markley mean orientation, and validate that offset * q stays within
 * the tolerance of identity across the window.
 *
 * A fallback window or a failed validation yields a Degraded result; the
 * offsets are still returned.
 *
 * @ticket 0011_anatomical_calibration
 */
class CalibrationEngine
{
public:
  struct Config
  {
    ReferenceWindowDetector::Config window{};
    PoseCorrection::Config pose{};
    double toleranceDeg{1.0};
    std::size_t minSamples{3};
  };

  /**
   * @brief Run the calibration
   *
   * @throws std::runtime_error if no reference window can be found or no
   *         joint has enough valid samples inside it
   */
  [[nodiscard]] static StageResult<CalibrationResult> calibrate(
    const MotionSession& session,
    const Config& config);

  [[nodiscard]] static StageResult<CalibrationResult> calibrate(
    const MotionSession& session);

  /**
   * @brief Average orientation (dominant eigenvector of sum q q^T)
   *
   * Samples are hemisphere-aligned to the first one before accumulating.
   * The result is normalized with w >= 0.
   *
   * @throws std::invalid_argument if samples is empty
   */
  [[nodiscard]] static QuaternionD markleyMean(
    std::span<const QuaternionD> samples);

  /**
   * @brief offset * q for every sample, NaN samples stay missing
   */
  [[nodiscard]] static QuaternionSeries applyOffset(
    std::span<const QuaternionD> series,
    const QuaternionD& offset);

  /**
   * @brief Pre-multiply the stored pose correction onto shoulder joints
   */
  [[nodiscard]] static MotionSession applyPoseCorrection(
    const MotionSession& session,
    const CalibrationResult& calibration);

  // Intrinsic X-Y-Z Euler angles [rad]
  [[nodiscard]] static Eigen::Vector3d eulerXYZ(const QuaternionD& q);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_CALIBRATION_ENGINE_HPP
