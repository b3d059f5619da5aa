// Ticket: 0003_session_data_model

#ifndef MOCAP_CORE_MOTION_SESSION_HPP
#define MOCAP_CORE_MOTION_SESSION_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mocap-core/src/DataTypes/Quaternion.hpp"
#include "mocap-core/src/DataTypes/Skeleton.hpp"

namespace mocap_core
{

/**
 * @brief One sample instant of a session
 */
struct Frame
{
  std::size_t index{0};
  double time{0.0};  // [s]
};

/**
 * @brief Orientation and position of one joint at one frame
 */
struct Pose
{
  QuaternionD orientation;
  Eigen::Vector3d position{Eigen::Vector3d::Zero()};  // [mm]
};

/**
 * @brief Contiguous per-joint sample storage
 *
 * Row i of positions and element i of orientations belong to frame i.
 * Missing samples are NaN.
 */
struct JointTrack
{
  Eigen::MatrixX3d positions;  // [mm], one row per frame
  QuaternionSeries orientations;
};

/**
 * @brief One recording: run id, skeleton and time-ordered frames
 *
 * A session exclusively owns its frames and skeleton. Tracks are stored in an
 * arena indexed by JointIndex, in skeleton order. Stages never mutate a
 * session in place; they build a new one.
 *
 * Invariant: timestamps are strictly increasing. Violation is fatal and
 * rejected at construction.
 *
 * @ticket 0003_session_data_model
 */
class MotionSession
{
public:
  /**
   * @brief Construct and validate a session
   *
   * @param runId Recording identifier, used to namespace persisted artifacts
   * @param skeleton Joint hierarchy
   * @param times Frame timestamps [s]
   * @param tracks One track per skeleton joint, each with times.size() samples
   * @throws std::runtime_error if time is not strictly increasing
   * @throws std::invalid_argument on any size mismatch
   */
  MotionSession(std::string runId,
                Skeleton skeleton,
                std::vector<double> times,
                std::vector<JointTrack> tracks);

  [[nodiscard]] const std::string& runId() const
  {
    return runId_;
  }

  [[nodiscard]] const Skeleton& skeleton() const
  {
    return skeleton_;
  }

  [[nodiscard]] const std::vector<double>& times() const
  {
    return times_;
  }

  [[nodiscard]] std::size_t frameCount() const
  {
    return times_.size();
  }

  [[nodiscard]] std::size_t jointCount() const
  {
    return tracks_.size();
  }

  // Last minus first timestamp [s]
  [[nodiscard]] double duration() const;

  [[nodiscard]] Frame frame(std::size_t index) const;

  [[nodiscard]] Pose pose(JointIndex joint, std::size_t frameIndex) const;

  [[nodiscard]] const JointTrack& track(JointIndex joint) const
  {
    return tracks_.at(joint);
  }

  [[nodiscard]] const std::vector<JointTrack>& tracks() const
  {
    return tracks_;
  }

  /**
   * @brief Copy of this session with one track replaced
   */
  [[nodiscard]] MotionSession withTrack(JointIndex joint, JointTrack track) const;

  /**
   * @brief Copy of this session with all tracks replaced
   */
  [[nodiscard]] MotionSession withTracks(std::vector<double> times,
                                         std::vector<JointTrack> tracks) const;

  // Rule of Zero
  MotionSession(const MotionSession&) = default;
  MotionSession(MotionSession&&) noexcept = default;
  MotionSession& operator=(const MotionSession&) = default;
  MotionSession& operator=(MotionSession&&) noexcept = default;
  ~MotionSession() = default;

private:
  void validate() const;

  std::string runId_;
  Skeleton skeleton_;
  std::vector<double> times_;
  std::vector<JointTrack> tracks_;
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_MOTION_SESSION_HPP
