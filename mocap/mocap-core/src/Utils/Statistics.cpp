// Ticket: 0004_robust_statistics

#include "mocap-core/src/Utils/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numeric>

namespace mocap_core::stats
{

namespace
{
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

double mean(std::span<const double> values)
{
  if (values.empty())
  {
    return kNaN;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double stddev(std::span<const double> values)
{
  if (values.empty())
  {
    return kNaN;
  }
  double const m = mean(values);
  double sumSq = 0.0;
  for (double const v : values)
  {
    sumSq += (v - m) * (v - m);
  }
  return std::sqrt(sumSq / static_cast<double>(values.size()));
}

double median(std::span<const double> values)
{
  return percentile(values, 50.0);
}

double mad(std::span<const double> values)
{
  if (values.empty())
  {
    return kNaN;
  }
  double const med = median(values);
  std::vector<double> deviations;
  deviations.reserve(values.size());
  for (double const v : values)
  {
    deviations.push_back(std::abs(v - med));
  }
  return median(deviations);
}

double percentile(std::span<const double> values, double p)
{
  if (values.empty())
  {
    return kNaN;
  }
  std::vector<double> sorted(values.begin(), values.end());
  std::sort(sorted.begin(), sorted.end());

  double const rank =
    std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
  auto const lo = static_cast<std::size_t>(std::floor(rank));
  auto const hi = static_cast<std::size_t>(std::ceil(rank));
  double const frac = rank - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

double rms(std::span<const double> values)
{
  if (values.empty())
  {
    return kNaN;
  }
  double sumSq = 0.0;
  for (double const v : values)
  {
    sumSq += v * v;
  }
  return std::sqrt(sumSq / static_cast<double>(values.size()));
}

std::vector<double> diff(std::span<const double> values)
{
  std::vector<double> out;
  if (values.size() < 2)
  {
    return out;
  }
  out.reserve(values.size() - 1);
  for (std::size_t i = 1; i < values.size(); ++i)
  {
    out.push_back(values[i] - values[i - 1]);
  }
  return out;
}

std::vector<double> finiteOnly(std::span<const double> values)
{
  std::vector<double> out;
  out.reserve(values.size());
  std::copy_if(values.begin(),
               values.end(),
               std::back_inserter(out),
               [](double v) { return std::isfinite(v); });
  return out;
}

double linearSlope(std::span<const double> x, std::span<const double> y)
{
  std::size_t const n = std::min(x.size(), y.size());
  if (n < 2)
  {
    return kNaN;
  }
  double const mx = mean(x.first(n));
  double const my = mean(y.first(n));
  double num = 0.0;
  double den = 0.0;
  for (std::size_t i = 0; i < n; ++i)
  {
    num += (x[i] - mx) * (y[i] - my);
    den += (x[i] - mx) * (x[i] - mx);
  }
  if (den <= 0.0)
  {
    return 0.0;
  }
  return num / den;
}

}  // namespace mocap_core::stats
