// Ticket: 0012_kinematics_derivation

#include "mocap-core/src/Kinematics/KinematicsEngine.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Calibration/CalibrationEngine.hpp"
#include "mocap-core/src/Kinematics/SavitzkyGolay.hpp"
#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Utils/utils.hpp"

namespace mocap_core
{

std::optional<std::size_t> KinematicsResult::indexOf(const std::string& jointName) const
{
  for (std::size_t i = 0; i < joints.size(); ++i)
  {
    if (joints[i].jointName == jointName)
    {
      return i;
    }
  }
  return std::nullopt;
}

std::vector<QuaternionSeries> KinematicsEngine::localOrientations(
  const MotionSession& session)
{
  const auto& skeleton = session.skeleton();
  std::size_t const n = session.frameCount();
  std::vector<QuaternionSeries> local(session.jointCount());

  for (JointIndex const j : skeleton.topologicalOrder())
  {
    const auto& child = session.track(j).orientations;
    auto const parent = skeleton.parent(j);
    if (!parent)
    {
      local[j] = QuaternionOps::normalizeSeries(child);
    }
    else
    {
      const auto& parentSeries = session.track(*parent).orientations;
      QuaternionSeries series(n);
      for (std::size_t i = 0; i < n; ++i)
      {
        if (!child[i].allFinite() || !parentSeries[i].allFinite())
        {
          series[i] = QuaternionD::missing();
          continue;
        }
        series[i] = QuaternionOps::normalize(QuaternionOps::compose(
          QuaternionOps::invert(parentSeries[i]), child[i]));
      }
      local[j] = std::move(series);
    }
    local[j] = QuaternionOps::enforceContinuity(local[j]);
  }
  return local;
}

QuaternionD KinematicsEngine::referenceOrientation(const QuaternionSeries& series,
                                                   const ReferenceWindow& window)
{
  QuaternionSeries samples;
  std::size_t const end = std::min(window.endFrame, series.size());
  for (std::size_t i = window.startFrame; i < end; ++i)
  {
    if (series[i].allFinite())
    {
      samples.push_back(series[i]);
    }
  }
  if (samples.empty())
  {
    return QuaternionD{};
  }
  return CalibrationEngine::markleyMean(samples);
}

QuaternionSeries KinematicsEngine::zeroed(const QuaternionSeries& local,
                                          const QuaternionD& referenceLocal)
{
  QuaternionD const inverse = QuaternionOps::invert(referenceLocal);
  QuaternionSeries out(local.size());
  for (std::size_t i = 0; i < local.size(); ++i)
  {
    out[i] = local[i].allFinite()
               ? QuaternionOps::normalize(QuaternionOps::compose(inverse, local[i]))
               : QuaternionD::missing();
  }
  return out;
}

Eigen::MatrixX3d KinematicsEngine::rotationVectorsDeg(const QuaternionSeries& series)
{
  auto const n = static_cast<Eigen::Index>(series.size());
  Eigen::MatrixX3d out(n, 3);
  for (Eigen::Index i = 0; i < n; ++i)
  {
    const auto& q = series[static_cast<std::size_t>(i)];
    if (!q.allFinite())
    {
      out.row(i).setConstant(std::numeric_limits<double>::quiet_NaN());
      continue;
    }
    out.row(i) = (QuaternionOps::toRotationVector(q) * kRadToDeg).transpose();
  }
  return out;
}

double KinematicsEngine::maxRowNorm(const Eigen::MatrixX3d& values)
{
  double maxNorm = 0.0;
  for (Eigen::Index i = 0; i < values.rows(); ++i)
  {
    if (values.row(i).allFinite())
    {
      maxNorm = std::max(maxNorm, values.row(i).norm());
    }
  }
  return maxNorm;
}

KinematicsResult KinematicsEngine::compute(const MotionSession& session,
                                           const ReferenceWindow& window,
                                           double samplingRate,
                                           const Config& config)
{
  if (!(samplingRate > 0.0))
  {
    throw std::invalid_argument{"KinematicsEngine: sampling rate must be positive"};
  }
  if (window.size() == 0 || window.endFrame > session.frameCount())
  {
    throw std::invalid_argument{
      "KinematicsEngine: reference window is empty or out of range"};
  }
  auto const root = session.skeleton().root();
  if (!root)
  {
    throw std::runtime_error{"KinematicsEngine: skeleton has no root joint"};
  }

  double const dt = 1.0 / samplingRate;
  std::size_t const window0 = SavitzkyGolay::windowFromSeconds(
    config.sgWindowSeconds, samplingRate, config.sgPolyorder);
  std::size_t const sgWindow =
    SavitzkyGolay::fitWindow(window0, session.frameCount(), config.sgPolyorder);
  if (sgWindow != window0)
  {
    spdlog::warn("KinematicsEngine: run {} shrinks smoothing window {} -> {}",
                 session.runId(),
                 window0,
                 sgWindow);
  }

  KinematicsResult result;
  result.times = session.times();
  result.samplingRate = samplingRate;
  result.sgWindow = sgWindow;
  result.sgPolyorder = config.sgPolyorder;
  result.frame = config.frame;

  auto const local = localOrientations(session);
  const auto& rootPositions = session.track(*root).positions;

  for (JointIndex j = 0; j < session.jointCount(); ++j)
  {
    JointKinematics jk;
    jk.joint = j;
    jk.jointName = session.skeleton().name(j);
    jk.localOrientation = local[j];
    jk.referenceLocal = referenceOrientation(local[j], window);
    jk.zeroedOrientation = zeroed(local[j], jk.referenceLocal);
    jk.rotationVectorDeg = rotationVectorsDeg(jk.zeroedOrientation);

    jk.angularVelocityDeg =
      AngularVelocityEstimator::quaternionLog(jk.localOrientation, dt, config.frame) *
      kRadToDeg;
    jk.angularAccelerationDeg = SavitzkyGolay::apply(
      jk.angularVelocityDeg, sgWindow, config.sgPolyorder, 1, dt);

    const auto& positions = session.track(j).positions;
    jk.linearVelocity =
      SavitzkyGolay::apply(positions, sgWindow, config.sgPolyorder, 1, dt);
    jk.linearAcceleration =
      SavitzkyGolay::apply(positions, sgWindow, config.sgPolyorder, 2, dt);

    jk.rootRelativePosition = positions - rootPositions;
    jk.rootRelativeVelocity = SavitzkyGolay::apply(
      jk.rootRelativePosition, sgWindow, config.sgPolyorder, 1, dt);
    jk.rootRelativeAcceleration = SavitzkyGolay::apply(
      jk.rootRelativePosition, sgWindow, config.sgPolyorder, 2, dt);

    spdlog::debug("KinematicsEngine: {} max |omega| {:.1f} deg/s, max |alpha| "
                  "{:.1f} deg/s^2",
                  jk.jointName,
                  maxRowNorm(jk.angularVelocityDeg),
                  maxRowNorm(jk.angularAccelerationDeg));
    result.joints.push_back(std::move(jk));
  }

  spdlog::info("KinematicsEngine: run {} derived {} joint(s) over {} frame(s), "
               "SG window {} (order {})",
               session.runId(),
               result.joints.size(),
               session.frameCount(),
               sgWindow,
               config.sgPolyorder);
  return result;
}

KinematicsResult KinematicsEngine::compute(const MotionSession& session,
                                           const ReferenceWindow& window,
                                           double samplingRate)
{
  return compute(session, window, samplingRate, Config{});
}

}  // namespace mocap_core
