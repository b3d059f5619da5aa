// Ticket: 0010_hampel_prefilter

#include "mocap-core/src/Filtering/HampelFilter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{
// MAD of a normal distribution is 0.6745 sigma
constexpr double kMadScale = 0.6745;
constexpr double kMinSigma = 1e-10;
}  // namespace

HampelFilter::Result HampelFilter::apply(std::span<const double> signal)
{
  return apply(signal, Config{});
}

HampelFilter::Result HampelFilter::apply(std::span<const double> signal,
                                         const Config& config)
{
  if (config.windowSize == 0)
  {
    throw std::invalid_argument{"HampelFilter: window size must be positive"};
  }

  std::size_t const n = signal.size();
  Result result;
  result.filtered.assign(signal.begin(), signal.end());
  result.outlierMask.assign(n, false);
  if (n < config.windowSize)
  {
    return result;
  }

  std::size_t const half = config.windowSize / 2;
  for (std::size_t i = 0; i < n; ++i)
  {
    std::size_t const lo = i >= half ? i - half : 0;
    std::size_t const hi = std::min(n, i + half + 1);
    auto const window = stats::finiteOnly(signal.subspan(lo, hi - lo));
    if (window.empty())
    {
      continue;
    }

    double const med = stats::median(window);
    double const mad = stats::mad(window);
    double const sigma = mad > kMinSigma ? mad / kMadScale : kMinSigma;
    if (std::abs(signal[i] - med) > config.nSigma * sigma)
    {
      result.filtered[i] = med;
      result.outlierMask[i] = true;
      ++result.outlierCount;
    }
  }
  return result;
}

}  // namespace mocap_core
