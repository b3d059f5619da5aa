// Ticket: 0006_temporal_resampler

#include "mocap-core/src/Resampling/ArtifactDetector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{
// Scales MAD to the standard deviation of a normal distribution
constexpr double kMadToSigma = 1.4826;
}  // namespace

ArtifactDetector::Detection ArtifactDetector::detect(
  std::span<const double> times,
  const Eigen::MatrixX3d& positions,
  const Config& config)
{
  auto const n = static_cast<std::size_t>(positions.rows());
  if (times.size() != n)
  {
    throw std::invalid_argument{
      "ArtifactDetector: times and positions sizes differ"};
  }

  Detection detection;
  detection.mask.assign(n, false);
  if (n < 2)
  {
    return detection;
  }

  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    // First sample has zero velocity by construction
    std::vector<double> velocity(n, 0.0);
    std::vector<double> finite;
    finite.reserve(n);
    for (std::size_t i = 1; i < n; ++i)
    {
      double const dt = std::max(times[i] - times[i - 1], config.minTimeStep);
      velocity[i] = (positions(static_cast<Eigen::Index>(i), axis) -
                     positions(static_cast<Eigen::Index>(i - 1), axis)) /
                    dt;
    }
    for (double const v : velocity)
    {
      if (std::isfinite(v))
      {
        finite.push_back(v);
      }
    }
    if (finite.empty())
    {
      continue;
    }

    double const sigma =
      std::max(kMadToSigma * stats::mad(finite), config.sigmaFloor);
    detection.robustSigma[axis] = sigma;

    std::vector<bool> axisMask(n, false);
    for (std::size_t i = 0; i < n; ++i)
    {
      axisMask[i] = std::isfinite(velocity[i]) &&
                    std::abs(velocity[i]) > config.thresholdSigma * sigma;
    }
    axisMask = dilate(axisMask, config.dilationFrames);
    for (std::size_t i = 0; i < n; ++i)
    {
      detection.mask[i] = detection.mask[i] || axisMask[i];
    }
  }

  detection.artifactFrames = static_cast<std::size_t>(
    std::count(detection.mask.begin(), detection.mask.end(), true));
  return detection;
}

std::vector<bool> ArtifactDetector::dilate(const std::vector<bool>& mask,
                                           int radius)
{
  if (radius <= 0)
  {
    return mask;
  }
  auto const n = static_cast<std::ptrdiff_t>(mask.size());
  std::vector<bool> out(mask.size(), false);
  for (std::ptrdiff_t i = 0; i < n; ++i)
  {
    if (!mask[static_cast<std::size_t>(i)])
    {
      continue;
    }
    std::ptrdiff_t const lo = std::max<std::ptrdiff_t>(0, i - radius);
    std::ptrdiff_t const hi = std::min<std::ptrdiff_t>(n - 1, i + radius);
    for (std::ptrdiff_t k = lo; k <= hi; ++k)
    {
      out[static_cast<std::size_t>(k)] = true;
    }
  }
  return out;
}

Eigen::MatrixX3d ArtifactDetector::applyMask(const Eigen::MatrixX3d& positions,
                                             const std::vector<bool>& mask)
{
  Eigen::MatrixX3d out = positions;
  for (Eigen::Index i = 0; i < out.rows(); ++i)
  {
    if (mask.at(static_cast<std::size_t>(i)))
    {
      out.row(i).setConstant(std::numeric_limits<double>::quiet_NaN());
    }
  }
  return out;
}

}  // namespace mocap_core
