// Ticket: 0001_quaternion_kernel

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"

#include <algorithm>
#include <cmath>

namespace mocap_core
{

QuaternionD QuaternionOps::normalize(const QuaternionD& q)
{
  double const n = std::max(q.norm(), kNormEpsilon);
  return QuaternionD{q.w() / n, q.x() / n, q.y() / n, q.z() / n};
}

QuaternionD QuaternionOps::invert(const QuaternionD& q)
{
  return normalize(q).conjugate();
}

QuaternionD QuaternionOps::compose(const QuaternionD& a, const QuaternionD& b)
{
  return a * b;
}

QuaternionD QuaternionOps::shortest(const QuaternionD& q)
{
  return q.w() < 0.0 ? q.negated() : q;
}

Eigen::Vector3d QuaternionOps::toRotationVector(const QuaternionD& q)
{
  QuaternionD const u = shortest(normalize(q));
  Eigen::Vector3d const v{u.x(), u.y(), u.z()};
  double const vNorm = v.norm();
  if (vNorm < kSmallAngle)
  {
    // First-order: angle ~= 2 |v|
    return 2.0 * v;
  }
  double const theta = 2.0 * std::atan2(vNorm, u.w());
  return v * (theta / vNorm);
}

QuaternionD QuaternionOps::fromRotationVector(const Eigen::Vector3d& rv)
{
  double const theta = rv.norm();
  if (theta < kSmallAngle)
  {
    return normalize(QuaternionD{1.0, 0.5 * rv.x(), 0.5 * rv.y(), 0.5 * rv.z()});
  }
  Eigen::Vector3d const axis = rv / theta;
  double const s = std::sin(0.5 * theta);
  return QuaternionD{
    std::cos(0.5 * theta), axis.x() * s, axis.y() * s, axis.z() * s};
}

double QuaternionOps::angle(const QuaternionD& q)
{
  return toRotationVector(q).norm();
}

double QuaternionOps::angleBetween(const QuaternionD& a, const QuaternionD& b)
{
  return angle(compose(invert(a), normalize(b)));
}

QuaternionD QuaternionOps::slerp(const QuaternionD& a,
                                 const QuaternionD& b,
                                 double t)
{
  // Eigen::Quaterniond::slerp already takes the shorter arc
  return QuaternionD{normalize(a).eigen().slerp(t, normalize(b).eigen())};
}

QuaternionSeries QuaternionOps::normalizeSeries(
  std::span<const QuaternionD> series)
{
  QuaternionSeries out;
  out.reserve(series.size());
  for (const auto& q : series)
  {
    out.push_back(normalize(q));
  }
  return out;
}

QuaternionSeries QuaternionOps::enforceShortest(
  std::span<const QuaternionD> series)
{
  QuaternionSeries out;
  out.reserve(series.size());
  for (const auto& q : series)
  {
    out.push_back(shortest(q));
  }
  return out;
}

QuaternionSeries QuaternionOps::enforceContinuity(
  std::span<const QuaternionD> series)
{
  QuaternionSeries out(series.begin(), series.end());
  const QuaternionD* previous = nullptr;
  for (auto& q : out)
  {
    if (!q.allFinite())
    {
      continue;
    }
    if (previous != nullptr && previous->dot(q) < 0.0)
    {
      q = q.negated();
    }
    previous = &q;
  }
  return out;
}

std::size_t QuaternionOps::countDiscontinuities(
  std::span<const QuaternionD> series)
{
  std::size_t count = 0;
  const QuaternionD* previous = nullptr;
  for (const auto& q : series)
  {
    if (!q.allFinite())
    {
      continue;
    }
    if (previous != nullptr && previous->dot(q) < 0.0)
    {
      ++count;
    }
    previous = &q;
  }
  return count;
}

double QuaternionOps::minConsecutiveDot(std::span<const QuaternionD> series)
{
  double minDot = 1.0;
  const QuaternionD* previous = nullptr;
  for (const auto& q : series)
  {
    if (!q.allFinite())
    {
      continue;
    }
    if (previous != nullptr)
    {
      minDot = std::min(minDot, previous->dot(q));
    }
    previous = &q;
  }
  return minDot;
}

}  // namespace mocap_core
