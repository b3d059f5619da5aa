// Ticket: 0011_anatomical_calibration

#ifndef MOCAP_CORE_POSE_CORRECTION_HPP
#define MOCAP_CORE_POSE_CORRECTION_HPP

#include <string>
#include <vector>

#include "mocap-core/src/Calibration/ReferenceWindowDetector.hpp"
#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/DataTypes/Quaternion.hpp"

namespace mocap_core
{

/**
 * @brief Elevation of one arm during the reference window
 */
struct ArmElevation
{
  std::string shoulder;
  std::string elbow;
  double elevationDeg{0.0};  // NaN when the joints are missing
  bool correctionApplied{false};
  QuaternionD correction{1.0, 0.0, 0.0, 0.0};
};

/**
 * @brief Systematic arm elevation correction, kept apart from the offsets
 */
struct PoseCorrectionResult
{
  ArmElevation left;
  ArmElevation right;
  bool applied{false};
  QuaternionD rotation{1.0, 0.0, 0.0, 0.0};  // identity when not applied
  std::vector<std::string> shoulderJoints;
};

/**
 * @brief Detects an elevated (V) calibration pose
 *
 * The arm vector runs from the mean shoulder position to the mean elbow
 * position over the reference window. Elevation is measured against the
 * horizontal x-z plane (y up). Beyond the threshold a rotation taking the arm
 * onto its horizontal projection is produced. When both arms need a
 * correction the left one is used.
 *
 * @ticket 0011_anatomical_calibration
 */
class PoseCorrection
{
public:
  struct Config
  {
    double elevationThresholdDeg{5.0};
    std::string leftShoulder{"LeftShoulder"};
    std::string leftElbow{"LeftElbow"};
    std::string rightShoulder{"RightShoulder"};
    std::string rightElbow{"RightElbow"};
  };

  static constexpr double kMinHorizontalNorm = 1e-8;

  [[nodiscard]] static PoseCorrectionResult detect(const MotionSession& session,
                                                   const ReferenceWindow& window,
                                                   const Config& config);

  [[nodiscard]] static ArmElevation measureArm(const MotionSession& session,
                                               const ReferenceWindow& window,
                                               const std::string& shoulder,
                                               const std::string& elbow,
                                               double thresholdDeg);

  /**
   * @brief Pre-multiply the stored correction onto the shoulder joints
   *
   * @return Copy of the session, unchanged when no correction was applied
   */
  [[nodiscard]] static MotionSession apply(const MotionSession& session,
                                           const PoseCorrectionResult& pose);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_POSE_CORRECTION_HPP
