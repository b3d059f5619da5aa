// Ticket: 0013_surgical_repair

#include "mocap-core/src/Kinematics/SurgicalRepair.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Kinematics/SavitzkyGolay.hpp"
#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Resampling/Interpolation.hpp"
#include "mocap-core/src/Utils/utils.hpp"

namespace mocap_core
{

namespace
{

// Row norm above limit, NaN rows never flag
bool exceeds(const Eigen::MatrixX3d& values, Eigen::Index row, double limit)
{
  return values.row(row).allFinite() && values.row(row).norm() > limit;
}

// False when every frame is flagged
bool repairAngular(JointKinematics& joint,
                   const std::vector<std::size_t>& frames,
                   const KinematicsResult& settings)
{
  double const dt = 1.0 / settings.samplingRate;
  QuaternionSeries const original = joint.localOrientation;
  std::size_t const n = original.size();
  QuaternionSeries patched = original;

  std::vector<bool> flagged(n, false);
  for (std::size_t const i : frames)
  {
    flagged[i] = true;
  }

  // Each run of flagged frames is bridged between the unflagged frames on
  // either side; a run touching an end copies its one unflagged neighbour
  std::size_t start = 0;
  while (start < n)
  {
    if (!flagged[start])
    {
      ++start;
      continue;
    }
    std::size_t end = start;
    while (end + 1 < n && flagged[end + 1])
    {
      ++end;
    }

    bool const hasLeft = start > 0;
    bool const hasRight = end + 1 < n;
    if (hasLeft && hasRight)
    {
      std::size_t const left = start - 1;
      std::size_t const right = end + 1;
      auto const span = static_cast<double>(right - left);
      for (std::size_t i = start; i <= end; ++i)
      {
        patched[i] = QuaternionOps::slerp(
          original[left], original[right], static_cast<double>(i - left) / span);
      }
    }
    else if (hasLeft || hasRight)
    {
      QuaternionD const anchor = hasLeft ? original[start - 1] : original[end + 1];
      for (std::size_t i = start; i <= end; ++i)
      {
        patched[i] = anchor;
      }
    }
    else
    {
      spdlog::warn("SurgicalRepair: every frame of {} is flagged, angular "
                   "repair skipped",
                   joint.jointName);
      return false;
    }
    start = end + 1;
  }

  joint.localOrientation =
    QuaternionOps::enforceContinuity(QuaternionOps::normalizeSeries(patched));
  joint.zeroedOrientation =
    KinematicsEngine::zeroed(joint.localOrientation, joint.referenceLocal);
  joint.rotationVectorDeg = KinematicsEngine::rotationVectorsDeg(joint.zeroedOrientation);
  joint.angularVelocityDeg =
    AngularVelocityEstimator::quaternionLog(joint.localOrientation, dt, settings.frame) *
    kRadToDeg;
  joint.angularAccelerationDeg = SavitzkyGolay::apply(
    joint.angularVelocityDeg, settings.sgWindow, settings.sgPolyorder, 1, dt);
  return true;
}

// False when fewer than two good frames remain
bool repairLinear(JointKinematics& joint,
                  const std::vector<std::size_t>& frames,
                  const KinematicsResult& settings)
{
  double const dt = 1.0 / settings.samplingRate;
  auto const n = joint.rootRelativePosition.rows();
  std::vector<bool> flagged(static_cast<std::size_t>(n), false);
  for (std::size_t const i : frames)
  {
    flagged[i] = true;
  }

  std::vector<double> goodIndex;
  for (Eigen::Index i = 0; i < n; ++i)
  {
    if (!flagged[static_cast<std::size_t>(i)] &&
        joint.rootRelativePosition.row(i).allFinite())
    {
      goodIndex.push_back(static_cast<double>(i));
    }
  }
  if (goodIndex.size() < 2)
  {
    spdlog::warn("SurgicalRepair: {} has {} good frame(s), linear repair "
                 "skipped",
                 joint.jointName,
                 goodIndex.size());
    return false;
  }

  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    std::vector<double> goodValues;
    goodValues.reserve(goodIndex.size());
    for (double const g : goodIndex)
    {
      goodValues.push_back(joint.rootRelativePosition(static_cast<Eigen::Index>(g), axis));
    }
    MonotoneCubic const pchip{goodIndex, goodValues};
    for (std::size_t const i : frames)
    {
      auto const x = static_cast<double>(i);
      double value = 0.0;
      if (x <= goodIndex.front())
      {
        value = goodValues.front();
      }
      else if (x >= goodIndex.back())
      {
        value = goodValues.back();
      }
      else
      {
        value = pchip(x);
      }
      joint.rootRelativePosition(static_cast<Eigen::Index>(i), axis) = value;
    }
  }

  joint.rootRelativeVelocity = SavitzkyGolay::apply(
    joint.rootRelativePosition, settings.sgWindow, settings.sgPolyorder, 1, dt);
  joint.rootRelativeAcceleration = SavitzkyGolay::apply(
    joint.rootRelativePosition, settings.sgWindow, settings.sgPolyorder, 2, dt);
  return true;
}

}  // namespace

RepairMetrics SurgicalRepair::measure(const JointKinematics& joint)
{
  RepairMetrics m;
  m.maxRotationDeg = KinematicsEngine::maxRowNorm(joint.rotationVectorDeg);
  m.maxAngularVelocityDeg = KinematicsEngine::maxRowNorm(joint.angularVelocityDeg);
  m.maxAngularAccelerationDeg =
    KinematicsEngine::maxRowNorm(joint.angularAccelerationDeg);
  m.maxLinearVelocity = KinematicsEngine::maxRowNorm(joint.rootRelativeVelocity);
  m.maxLinearAcceleration =
    KinematicsEngine::maxRowNorm(joint.rootRelativeAcceleration);
  return m;
}

std::vector<std::size_t> SurgicalRepair::flagAngular(const JointKinematics& joint,
                                                     const Config& config)
{
  std::vector<std::size_t> frames;
  for (Eigen::Index i = 0; i < joint.angularVelocityDeg.rows(); ++i)
  {
    if (exceeds(joint.rotationVectorDeg, i, config.maxRotationDeg) ||
        exceeds(joint.angularVelocityDeg, i, config.maxAngularVelocityDeg) ||
        exceeds(joint.angularAccelerationDeg, i, config.maxAngularAccelerationDeg))
    {
      frames.push_back(static_cast<std::size_t>(i));
    }
  }
  return frames;
}

std::vector<std::size_t> SurgicalRepair::flagLinear(const JointKinematics& joint,
                                                    const Config& config)
{
  std::vector<std::size_t> frames;
  for (Eigen::Index i = 0; i < joint.rootRelativeVelocity.rows(); ++i)
  {
    if (exceeds(joint.rootRelativeVelocity, i, config.maxLinearVelocity) ||
        exceeds(joint.rootRelativeAcceleration, i, config.maxLinearAcceleration))
    {
      frames.push_back(static_cast<std::size_t>(i));
    }
  }
  return frames;
}

SurgicalRepair::Result SurgicalRepair::repair(const KinematicsResult& kinematics,
                                              const Config& config)
{
  Result result;
  result.kinematics = kinematics;

  for (auto& joint : result.kinematics.joints)
  {
    JointRepair record;
    record.jointName = joint.jointName;
    record.before = measure(joint);

    if (joint.localOrientation.size() >= 2)
    {
      auto angular = flagAngular(joint, config);
      if (!angular.empty() && repairAngular(joint, angular, result.kinematics))
      {
        record.angularFrames = std::move(angular);
      }
    }

    auto linear = flagLinear(joint, config);
    if (!linear.empty() && repairLinear(joint, linear, result.kinematics))
    {
      record.linearFrames = std::move(linear);
    }

    if (record.angularFrames.empty() && record.linearFrames.empty())
    {
      continue;
    }
    record.after = measure(joint);
    result.angularFramesRepaired += record.angularFrames.size();
    result.linearFramesRepaired += record.linearFrames.size();
    spdlog::info("SurgicalRepair: {} repaired {} angular / {} linear frame(s), "
                 "max |omega| {:.0f} -> {:.0f} deg/s",
                 record.jointName,
                 record.angularFrames.size(),
                 record.linearFrames.size(),
                 record.before.maxAngularVelocityDeg,
                 record.after.maxAngularVelocityDeg);
    result.repairs.push_back(std::move(record));
  }
  return result;
}

SurgicalRepair::Result SurgicalRepair::repair(const KinematicsResult& kinematics)
{
  return repair(kinematics, Config{});
}

}  // namespace mocap_core
