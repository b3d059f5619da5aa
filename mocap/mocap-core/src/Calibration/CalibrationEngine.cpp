// Ticket: 0011_anatomical_calibration

#include "mocap-core/src/Calibration/CalibrationEngine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <Eigen/Eigenvalues>
#include <spdlog/spdlog.h>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Utils/Statistics.hpp"
#include "mocap-core/src/Utils/utils.hpp"

namespace mocap_core
{

namespace
{

QuaternionSeries windowSamples(const MotionSession& session,
                               JointIndex joint,
                               const ReferenceWindow& window)
{
  QuaternionSeries samples;
  const auto& series = session.track(joint).orientations;
  for (std::size_t i = window.startFrame; i < window.endFrame; ++i)
  {
    if (series[i].allFinite())
    {
      samples.push_back(QuaternionOps::normalize(series[i]));
    }
  }
  return samples;
}

}  // namespace

std::optional<CalibrationOffset> CalibrationResult::offsetFor(
  JointIndex joint) const
{
  auto it = std::find_if(offsets.begin(),
                         offsets.end(),
                         [joint](const CalibrationOffset& o)
                         { return o.joint == joint; });
  if (it == offsets.end())
  {
    return std::nullopt;
  }
  return *it;
}

QuaternionD CalibrationEngine::markleyMean(std::span<const QuaternionD> samples)
{
  if (samples.empty())
  {
    throw std::invalid_argument{"CalibrationEngine: no samples to average"};
  }

  Eigen::Vector4d const first = samples.front().wxyz();
  Eigen::Matrix4d accumulator = Eigen::Matrix4d::Zero();
  for (const auto& q : samples)
  {
    Eigen::Vector4d v = q.wxyz();
    if (v.dot(first) < 0.0)
    {
      v = -v;
    }
    accumulator += v * v.transpose();
  }

  // Eigenvalues are sorted in increasing order
  Eigen::SelfAdjointEigenSolver<Eigen::Matrix4d> solver{accumulator};
  Eigen::Vector4d mean = solver.eigenvectors().col(3);
  if (mean(0) < 0.0)
  {
    mean = -mean;
  }
  return QuaternionOps::normalize(QuaternionD{mean(0), mean(1), mean(2), mean(3)});
}

QuaternionSeries CalibrationEngine::applyOffset(std::span<const QuaternionD> series,
                                                const QuaternionD& offset)
{
  QuaternionSeries out;
  out.reserve(series.size());
  for (const auto& q : series)
  {
    out.push_back(q.allFinite() ? QuaternionOps::compose(offset, q)
                                : QuaternionD::missing());
  }
  return out;
}

Eigen::Vector3d CalibrationEngine::eulerXYZ(const QuaternionD& q)
{
  // R = Rx(a) * Ry(b) * Rz(c)
  Eigen::Matrix3d const r = QuaternionOps::normalize(q).toRotationMatrix();
  double const sb = std::clamp(r(0, 2), -1.0, 1.0);
  return Eigen::Vector3d{std::atan2(-r(1, 2), r(2, 2)),
                         std::asin(sb),
                         std::atan2(-r(0, 1), r(0, 0))};
}

MotionSession CalibrationEngine::applyPoseCorrection(
  const MotionSession& session,
  const CalibrationResult& calibration)
{
  return PoseCorrection::apply(session, calibration.pose);
}

StageResult<CalibrationResult> CalibrationEngine::calibrate(
  const MotionSession& session)
{
  return calibrate(session, Config{});
}

StageResult<CalibrationResult> CalibrationEngine::calibrate(
  const MotionSession& session,
  const Config& config)
{
  // 1. Reference window (throws when none exists)
  auto const windowResult = ReferenceWindowDetector::detect(session, config.window);

  CalibrationResult result;
  result.window = windowResult.value();
  const auto& window = result.window;

  // 2. Arm elevation, stored apart from the offsets
  result.pose = PoseCorrection::detect(session, window, config.pose);

  // 3. Offsets
  for (JointIndex j = 0; j < session.jointCount(); ++j)
  {
    auto const samples = windowSamples(session, j, window);
    if (samples.size() < config.minSamples)
    {
      spdlog::debug("CalibrationEngine: {} has {} valid sample(s) in the "
                    "window, skipped",
                    session.skeleton().name(j),
                    samples.size());
      continue;
    }
    CalibrationOffset offset;
    offset.joint = j;
    offset.jointName = session.skeleton().name(j);
    offset.reference = markleyMean(samples);
    offset.offset = QuaternionOps::invert(offset.reference);
    offset.samples = samples.size();
    result.offsets.push_back(std::move(offset));
  }
  if (result.offsets.empty())
  {
    throw std::runtime_error{
      "CalibrationEngine: no joint has valid orientations in the reference "
      "window"};
  }

  // 4. Validation: residual of offset * q against identity
  auto& validation = result.validation;
  validation.toleranceDeg = config.toleranceDeg;
  for (const auto& offset : result.offsets)
  {
    auto const samples = windowSamples(session, offset.joint, window);
    std::vector<double> residuals;
    residuals.reserve(samples.size());
    for (const auto& q : samples)
    {
      residuals.push_back(
        QuaternionOps::angle(QuaternionOps::compose(offset.offset, q)) *
        kRadToDeg);
    }
    JointResidual jr;
    jr.jointName = offset.jointName;
    jr.medianResidualDeg = stats::median(residuals);
    jr.maxResidualDeg = *std::max_element(residuals.begin(), residuals.end());
    jr.offsetAngleDeg = QuaternionOps::angle(offset.offset) * kRadToDeg;
    jr.passed = jr.medianResidualDeg < config.toleranceDeg;
    if (!jr.passed)
    {
      validation.failedJoints.push_back(jr.jointName);
    }
    validation.joints.push_back(std::move(jr));
  }
  validation.passed = validation.failedJoints.empty();

  // Advisory anatomy check of the shoulders
  for (const auto& name : result.pose.shoulderJoints)
  {
    auto const joint = session.skeleton().indexOf(name);
    if (!joint)
    {
      continue;
    }
    auto const offset = result.offsetFor(*joint);
    if (!offset)
    {
      continue;
    }
    auto const samples = windowSamples(session, *joint, window);
    std::vector<double> ex;
    std::vector<double> ey;
    std::vector<double> ez;
    for (const auto& q : samples)
    {
      auto const anatomical = QuaternionOps::compose(
        result.pose.rotation, QuaternionOps::compose(offset->offset, q));
      Eigen::Vector3d const e = eulerXYZ(anatomical) * kRadToDeg;
      ex.push_back(e.x());
      ey.push_back(e.y());
      ez.push_back(e.z());
    }
    AnatomyCheck check;
    check.jointName = name;
    check.eulerMeanDeg =
      Eigen::Vector3d{stats::mean(ex), stats::mean(ey), stats::mean(ez)};
    check.eulerMedianDeg = Eigen::Vector3d{
      stats::median(ex), stats::median(ey), stats::median(ez)};
    check.deviationScore = check.eulerMeanDeg.norm();
    check.poseCorrectionApplied = result.pose.applied;
    result.anatomy.push_back(std::move(check));
  }

  std::vector<std::string> reasons;
  if (windowResult.isDegraded())
  {
    reasons.push_back(windowResult.reason());
  }
  if (!validation.passed)
  {
    reasons.push_back(std::to_string(validation.failedJoints.size()) +
                      " joint(s) exceed the residual tolerance of " +
                      std::to_string(config.toleranceDeg) + " deg");
  }

  spdlog::info("CalibrationEngine: run {} calibrated {} joint(s) from "
               "{:.2f}-{:.2f} s ({}), validation {}",
               session.runId(),
               result.offsets.size(),
               window.startTime,
               window.endTime,
               window.method,
               validation.passed ? "PASS" : "FAIL");

  if (reasons.empty())
  {
    return StageResult<CalibrationResult>::success(std::move(result));
  }
  std::string reason = reasons.front();
  for (std::size_t i = 1; i < reasons.size(); ++i)
  {
    reason += "; " + reasons[i];
  }
  spdlog::warn("CalibrationEngine: {}", reason);
  return StageResult<CalibrationResult>::degraded(std::move(result),
                                                  std::move(reason));
}

}  // namespace mocap_core
