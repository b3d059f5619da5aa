// Ticket: 0013_surgical_repair

#ifndef MOCAP_CORE_SURGICAL_REPAIR_HPP
#define MOCAP_CORE_SURGICAL_REPAIR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "mocap-core/src/Kinematics/KinematicsEngine.hpp"

namespace mocap_core
{

/**
 * @brief Peak magnitudes of one joint's kinematics
 */
struct RepairMetrics
{
  double maxRotationDeg{0.0};
  double maxAngularVelocityDeg{0.0};      // [deg/s]
  double maxAngularAccelerationDeg{0.0};  // [deg/s^2]
  double maxLinearVelocity{0.0};          // root-relative [mm/s]
  double maxLinearAcceleration{0.0};      // root-relative [mm/s^2]
};

/**
 * @brief What was repaired on one joint
 */
struct JointRepair
{
  std::string jointName;
  std::vector<std::size_t> angularFrames;
  std::vector<std::size_t> linearFrames;
  RepairMetrics before;
  RepairMetrics after;
};

/**
 * @brief Localized repair of physically implausible kinematics
 *
 * Angular: frames where the rotation magnitude, |omega| or |alpha| exceeds
 * its critical threshold are grouped into contiguous runs. Each run is
 * re-interpolated in the parent-relative orientation by slerp between the
 * nearest unflagged frames on either side, so a flagged frame never blends
 * with another flagged frame. A run touching the first or last frame copies
 * its single unflagged neighbour. Omega and alpha are then re-derived for
 * that joint.
 *
 * Linear: frames where the root-relative |v| or |a| exceeds its threshold
 * are re-interpolated with a monotone cubic through the unflagged frames,
 * clamped to the nearest unflagged value outside their span, and v and a are
 * re-derived for that joint.
 *
 * The input is never modified; a patched copy is returned.
 *
 * @ticket 0013_surgical_repair
 */
class SurgicalRepair
{
public:
  struct Config
  {
    double maxRotationDeg{140.0};
    double maxAngularVelocityDeg{2000.0};
    double maxAngularAccelerationDeg{50000.0};
    double maxLinearVelocity{3000.0};
    double maxLinearAcceleration{100000.0};
  };

  struct Result
  {
    KinematicsResult kinematics;
    std::vector<JointRepair> repairs;  // joints that were touched
    std::size_t angularFramesRepaired{0};
    std::size_t linearFramesRepaired{0};
  };

  [[nodiscard]] static Result repair(const KinematicsResult& kinematics,
                                     const Config& config);

  [[nodiscard]] static Result repair(const KinematicsResult& kinematics);

  [[nodiscard]] static RepairMetrics measure(const JointKinematics& joint);

  // Frames over any angular threshold
  [[nodiscard]] static std::vector<std::size_t> flagAngular(
    const JointKinematics& joint,
    const Config& config);

  // Frames over any root-relative linear threshold
  [[nodiscard]] static std::vector<std::size_t> flagLinear(
    const JointKinematics& joint,
    const Config& config);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_SURGICAL_REPAIR_HPP
