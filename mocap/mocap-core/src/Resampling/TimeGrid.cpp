// Ticket: 0006_temporal_resampler

#include "mocap-core/src/Resampling/TimeGrid.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

std::vector<double> TimeGrid::build(double tStart, double tEnd, double fs)
{
  if (!(fs > 0.0))
  {
    throw std::invalid_argument{"TimeGrid: sampling rate must be positive"};
  }
  if (!(tEnd >= tStart))
  {
    throw std::invalid_argument{"TimeGrid: tEnd must not precede tStart"};
  }

  // Tolerance absorbs representation error when duration * fs is integral
  constexpr double kIndexTolerance = 1e-9;
  auto const last = static_cast<std::size_t>(
    std::floor((tEnd - tStart) * fs + kIndexTolerance));

  std::vector<double> grid(last + 1);
  for (std::size_t i = 0; i <= last; ++i)
  {
    grid[i] = tStart + static_cast<double>(i) / fs;
  }
  // Clamp the representation error of the final sample onto the span
  grid.back() = std::min(grid.back(), tEnd);
  return grid;
}

double TimeGrid::estimateSamplingRate(std::span<const double> times)
{
  if (times.size() < 2)
  {
    throw std::invalid_argument{
      "TimeGrid: need at least two timestamps to estimate the sampling rate"};
  }
  double const medianDt = stats::median(stats::diff(times));
  if (!(medianDt > 0.0))
  {
    throw std::invalid_argument{"TimeGrid: non-positive median time step"};
  }
  return 1.0 / medianDt;
}

double TimeGrid::deltaStd(std::span<const double> times)
{
  if (times.size() < 2)
  {
    return 0.0;
  }
  return stats::stddev(stats::diff(times));
}

double TimeGrid::maxDelta(std::span<const double> times)
{
  auto const deltas = stats::diff(times);
  if (deltas.empty())
  {
    return 0.0;
  }
  return *std::max_element(deltas.begin(), deltas.end());
}

}  // namespace mocap_core
