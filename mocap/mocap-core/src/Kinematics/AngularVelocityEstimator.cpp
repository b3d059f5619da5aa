// Ticket: 0012_kinematics_derivation

#include "mocap-core/src/Kinematics/AngularVelocityEstimator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

void requirePositive(double dt)
{
  if (!(dt > 0.0))
  {
    throw std::invalid_argument{
      "AngularVelocityEstimator: time step must be positive"};
  }
}

double meanFinite(const Eigen::VectorXd& values)
{
  std::vector<double> v(values.data(), values.data() + values.size());
  return stats::mean(stats::finiteOnly(v));
}

}  // namespace

Eigen::Vector3d AngularVelocityEstimator::simpleRate(const QuaternionD& q0,
                                                     const QuaternionD& q1,
                                                     double dt,
                                                     RotationFrame frame)
{
  if (!q0.allFinite() || !q1.allFinite())
  {
    return Eigen::Vector3d::Constant(kNaN);
  }
  QuaternionD const a = QuaternionOps::normalize(q0);
  QuaternionD b = QuaternionOps::normalize(q1);
  if (a.dot(b) < 0.0)
  {
    b = b.negated();
  }
  QuaternionD const dq = frame == RotationFrame::Local
                           ? QuaternionOps::compose(QuaternionOps::invert(a), b)
                           : QuaternionOps::compose(b, QuaternionOps::invert(a));
  return QuaternionOps::toRotationVector(dq) / dt;
}

Eigen::MatrixX3d AngularVelocityEstimator::quaternionLog(
  std::span<const QuaternionD> q,
  double dt,
  RotationFrame frame)
{
  requirePositive(dt);
  auto const n = static_cast<Eigen::Index>(q.size());
  Eigen::MatrixX3d omega = Eigen::MatrixX3d::Zero(n, 3);
  for (Eigen::Index t = 0; t + 1 < n; ++t)
  {
    omega.row(t) = simpleRate(q[static_cast<std::size_t>(t)],
                              q[static_cast<std::size_t>(t + 1)],
                              dt,
                              frame)
                     .transpose();
  }
  if (n > 1)
  {
    omega.row(n - 1) = omega.row(n - 2);
  }
  return omega;
}

Eigen::MatrixX3d AngularVelocityEstimator::centralDifference(
  std::span<const QuaternionD> q,
  double dt,
  RotationFrame frame)
{
  requirePositive(dt);
  auto const n = static_cast<Eigen::Index>(q.size());
  Eigen::MatrixX3d omega = Eigen::MatrixX3d::Zero(n, 3);
  if (n < 2)
  {
    return omega;
  }
  for (Eigen::Index t = 1; t + 1 < n; ++t)
  {
    omega.row(t) = simpleRate(q[static_cast<std::size_t>(t - 1)],
                              q[static_cast<std::size_t>(t + 1)],
                              2.0 * dt,
                              frame)
                     .transpose();
  }
  omega.row(0) = simpleRate(q[0], q[1], dt, frame).transpose();
  omega.row(n - 1) = simpleRate(q[static_cast<std::size_t>(n - 2)],
                                q[static_cast<std::size_t>(n - 1)],
                                dt,
                                frame)
                       .transpose();
  return omega;
}

Eigen::MatrixX3d AngularVelocityEstimator::fivePoint(std::span<const QuaternionD> q,
                                                     double dt,
                                                     RotationFrame frame)
{
  requirePositive(dt);
  auto const n = static_cast<Eigen::Index>(q.size());
  Eigen::MatrixX3d omega = Eigen::MatrixX3d::Zero(n, 3);
  if (n < 2)
  {
    return omega;
  }

  // Forward rates r_t between t and t + 1
  Eigen::MatrixX3d forward = Eigen::MatrixX3d::Zero(n - 1, 3);
  for (Eigen::Index t = 0; t + 1 < n; ++t)
  {
    forward.row(t) = simpleRate(q[static_cast<std::size_t>(t)],
                                q[static_cast<std::size_t>(t + 1)],
                                dt,
                                frame)
                       .transpose();
  }

  for (Eigen::Index t = 0; t < n; ++t)
  {
    if (t < 2)
    {
      omega.row(t) = forward.row(t);
    }
    else if (t >= n - 2)
    {
      omega.row(t) = forward.row(t - 1);
    }
    else if (t + 2 < n - 1)
    {
      Eigen::RowVector3d acc = Eigen::RowVector3d::Zero();
      for (int k = 0; k < 5; ++k)
      {
        acc += kFivePointWeights[k] * forward.row(t - 2 + k);
      }
      omega.row(t) = acc;
    }
    else
    {
      omega.row(t) = forward.row(t);
    }
  }
  return omega;
}

Eigen::VectorXd AngularVelocityEstimator::magnitude(const Eigen::MatrixX3d& omega)
{
  return omega.rowwise().norm();
}

double AngularVelocityEstimator::noiseMetric(const Eigen::MatrixX3d& omega)
{
  Eigen::VectorXd const mag = magnitude(omega);
  std::vector<double> v(mag.data(), mag.data() + mag.size());
  auto const second = stats::diff(stats::diff(v));
  return stats::stddev(stats::finiteOnly(second));
}

EstimatorComparison AngularVelocityEstimator::compare(std::span<const QuaternionD> q,
                                                      double dt,
                                                      RotationFrame frame)
{
  EstimatorComparison c;
  c.quaternionLog = quaternionLog(q, dt, frame);
  c.fivePoint = fivePoint(q, dt, frame);
  c.central = centralDifference(q, dt, frame);

  c.meanMagnitudeLog = meanFinite(magnitude(c.quaternionLog));
  c.meanMagnitudeFivePoint = meanFinite(magnitude(c.fivePoint));
  c.meanMagnitudeCentral = meanFinite(magnitude(c.central));

  c.noiseLog = noiseMetric(c.quaternionLog);
  c.noiseFivePoint = noiseMetric(c.fivePoint);
  c.noiseCentral = noiseMetric(c.central);

  c.agreementLogFivePoint =
    meanFinite((c.quaternionLog - c.fivePoint).rowwise().norm());
  c.agreementLogCentral = meanFinite((c.quaternionLog - c.central).rowwise().norm());

  constexpr double inf = std::numeric_limits<double>::infinity();
  c.noiseReductionFivePoint =
    c.noiseFivePoint > 0.0 ? c.noiseCentral / c.noiseFivePoint : inf;
  c.noiseReductionLog = c.noiseLog > 0.0 ? c.noiseCentral / c.noiseLog : inf;

  if (c.noiseLog < 0.9 * c.noiseFivePoint && c.noiseLog < 0.9 * c.noiseCentral)
  {
    c.recommendation = "quaternion_log (lowest noise)";
  }
  else if (c.noiseFivePoint < 0.9 * c.noiseLog &&
           c.noiseFivePoint < 0.9 * c.noiseCentral)
  {
    c.recommendation = "5point_stencil (lowest noise)";
  }
  else if (c.noiseCentral > 0.0 &&
           std::abs(c.noiseLog - c.noiseFivePoint) / c.noiseCentral < 0.1)
  {
    c.recommendation = "quaternion_log (similar noise)";
  }
  else
  {
    c.recommendation = "quaternion_log (default)";
  }
  return c;
}

}  // namespace mocap_core
