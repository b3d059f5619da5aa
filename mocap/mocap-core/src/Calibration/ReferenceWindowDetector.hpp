// Ticket: 0011_anatomical_calibration

#ifndef MOCAP_CORE_REFERENCE_WINDOW_DETECTOR_HPP
#define MOCAP_CORE_REFERENCE_WINDOW_DETECTOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/DataTypes/StageResult.hpp"

namespace mocap_core
{

/**
 * @brief Static reference window and how it was found
 */
struct ReferenceWindow
{
  std::size_t startFrame{0};
  std::size_t endFrame{0};  // exclusive
  double startTime{0.0};    // [s]
  double endTime{0.0};      // [s], time of the last frame inside the window
  double positionScore{0.0};  // summed positional variance [mm^2]
  double meanMotion{0.0};     // [rad/s]
  double stdMotion{0.0};      // [rad/s]
  std::string method;         // "criteria" or "fallback_min_motion"
  bool isFallback{false};
  std::vector<std::string> referenceJoints;

  [[nodiscard]] std::size_t size() const
  {
    return endFrame - startFrame;
  }
};

/**
 * @brief Search the start of a recording for a static calibration pose
 *
 * Candidate windows slide over the first searchSeconds. Each is scored by the
 * summed positional variance of the reference joints (all joints when none of
 * them exist) and by the angular motion of the whole skeleton. Windows are
 * visited in order of increasing position score and the first one whose
 * motion mean and standard deviation are both below threshold is accepted.
 * Otherwise the window with the least mean motion is returned as a fallback.
 *
 * @ticket 0011_anatomical_calibration
 */
class ReferenceWindowDetector
{
public:
  struct Config
  {
    double searchSeconds{5.0};
    double windowSeconds{1.0};
    double stepSeconds{0.1};
    double motionMeanThreshold{0.30};  // [rad/s]
    double motionStdThreshold{0.15};   // [rad/s]
    std::vector<std::string> referenceJoints{"Hips", "LeftHand", "RightHand"};
  };

  /**
   * @brief Locate the reference window
   *
   * @return Success for a window meeting the motion criteria, Degraded for
   *         the minimum-motion fallback
   * @throws std::runtime_error if no candidate window has enough valid data
   * @throws std::invalid_argument on non-positive durations
   */
  [[nodiscard]] static StageResult<ReferenceWindow> detect(
    const MotionSession& session,
    const Config& config);

  /**
   * @brief Per-frame skeleton motion [rad/s]
   *
   * Entry t is the median over joints of |rotvec(q_t^-1 q_{t+1})| / dt.
   * Frames where no joint has two finite samples are NaN. The result has
   * frameCount() - 1 entries.
   */
  [[nodiscard]] static std::vector<double> motionProfile(
    const MotionSession& session);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_REFERENCE_WINDOW_DETECTOR_HPP
