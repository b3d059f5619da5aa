// Ticket: 0011_anatomical_calibration

#include "mocap-core/src/Calibration/PoseCorrection.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <utility>

#include <Eigen/Geometry>
#include <spdlog/spdlog.h>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Utils/utils.hpp"

namespace mocap_core
{

namespace
{

std::optional<Eigen::Vector3d> meanPosition(const MotionSession& session,
                                            JointIndex joint,
                                            const ReferenceWindow& window)
{
  const auto& positions = session.track(joint).positions;
  Eigen::Vector3d sum = Eigen::Vector3d::Zero();
  std::size_t count = 0;
  for (std::size_t i = window.startFrame; i < window.endFrame; ++i)
  {
    Eigen::Vector3d const p =
      positions.row(static_cast<Eigen::Index>(i)).transpose();
    if (p.allFinite())
    {
      sum += p;
      ++count;
    }
  }
  if (count == 0)
  {
    return std::nullopt;
  }
  return Eigen::Vector3d{sum / static_cast<double>(count)};
}

}  // namespace

ArmElevation PoseCorrection::measureArm(const MotionSession& session,
                                        const ReferenceWindow& window,
                                        const std::string& shoulder,
                                        const std::string& elbow,
                                        double thresholdDeg)
{
  ArmElevation arm;
  arm.shoulder = shoulder;
  arm.elbow = elbow;
  arm.elevationDeg = std::numeric_limits<double>::quiet_NaN();

  auto const s = session.skeleton().indexOf(shoulder);
  auto const e = session.skeleton().indexOf(elbow);
  if (!s || !e)
  {
    spdlog::debug("PoseCorrection: {} or {} not in skeleton", shoulder, elbow);
    return arm;
  }
  auto const ps = meanPosition(session, *s, window);
  auto const pe = meanPosition(session, *e, window);
  if (!ps || !pe)
  {
    return arm;
  }

  Eigen::Vector3d const v = *pe - *ps;
  double const horizontal = std::hypot(v.x(), v.z());
  arm.elevationDeg = std::atan2(v.y(), horizontal) * kRadToDeg;

  if (std::abs(arm.elevationDeg) <= thresholdDeg)
  {
    return arm;
  }
  if (horizontal < kMinHorizontalNorm)
  {
    spdlog::warn("PoseCorrection: {} arm has no horizontal component", shoulder);
    return arm;
  }

  Eigen::Vector3d const target{v.x(), 0.0, v.z()};
  Eigen::Quaterniond const r =
    Eigen::Quaterniond::FromTwoVectors(v.normalized(), target.normalized());
  arm.correction = QuaternionOps::normalize(QuaternionD{r});
  arm.correctionApplied = true;
  return arm;
}

PoseCorrectionResult PoseCorrection::detect(const MotionSession& session,
                                            const ReferenceWindow& window,
                                            const Config& config)
{
  PoseCorrectionResult result;
  result.shoulderJoints = {config.leftShoulder, config.rightShoulder};
  result.left = measureArm(session,
                           window,
                           config.leftShoulder,
                           config.leftElbow,
                           config.elevationThresholdDeg);
  result.right = measureArm(session,
                            window,
                            config.rightShoulder,
                            config.rightElbow,
                            config.elevationThresholdDeg);

  if (result.left.correctionApplied)
  {
    result.applied = true;
    result.rotation = result.left.correction;
  }
  else if (result.right.correctionApplied)
  {
    result.applied = true;
    result.rotation = result.right.correction;
  }

  if (result.applied)
  {
    spdlog::info("PoseCorrection: arm elevation left {:.2f} deg, right {:.2f} "
                 "deg, correction of {:.2f} deg stored",
                 result.left.elevationDeg,
                 result.right.elevationDeg,
                 QuaternionOps::angle(result.rotation) * kRadToDeg);
  }
  return result;
}

MotionSession PoseCorrection::apply(const MotionSession& session,
                                    const PoseCorrectionResult& pose)
{
  if (!pose.applied)
  {
    return session;
  }
  std::vector<JointTrack> tracks = session.tracks();
  for (const auto& name : pose.shoulderJoints)
  {
    auto const joint = session.skeleton().indexOf(name);
    if (!joint)
    {
      continue;
    }
    for (auto& q : tracks[*joint].orientations)
    {
      if (q.allFinite())
      {
        q = QuaternionOps::normalize(QuaternionOps::compose(pose.rotation, q));
      }
    }
  }
  return session.withTracks(session.times(), std::move(tracks));
}

}  // namespace mocap_core
