// Ticket: 0008_zero_phase_filter

#include "mocap-core/src/Filtering/ButterworthFilter.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace mocap_core
{

ButterworthFilter::Coefficients ButterworthFilter::design(double cutoffHz,
                                                          double fs)
{
  if (!(fs > 0.0) || !(cutoffHz > 0.0) || cutoffHz >= 0.5 * fs)
  {
    throw std::invalid_argument{
      "ButterworthFilter: cutoff must lie in (0, fs / 2)"};
  }

  double const k = std::tan(std::numbers::pi * cutoffHz / fs);
  double const k2 = k * k;
  double const norm = 1.0 / (1.0 + std::numbers::sqrt2 * k + k2);

  Coefficients c;
  c.b[0] = k2 * norm;
  c.b[1] = 2.0 * c.b[0];
  c.b[2] = c.b[0];
  c.a[0] = 1.0;
  c.a[1] = 2.0 * (k2 - 1.0) * norm;
  c.a[2] = (1.0 - std::numbers::sqrt2 * k + k2) * norm;
  return c;
}

std::array<double, 2> ButterworthFilter::steadyState(const Coefficients& c)
{
  // Solves (I - A^T) zi = B for the companion matrix of a
  double const b0 = c.b[1] - c.a[1] * c.b[0];
  double const b1 = c.b[2] - c.a[2] * c.b[0];
  double const z0 = (b0 + b1) / (1.0 + c.a[1] + c.a[2]);
  return {z0, b1 - c.a[2] * z0};
}

std::vector<double> ButterworthFilter::lfilter(const Coefficients& c,
                                               std::span<const double> x,
                                               std::array<double, 2> zi)
{
  std::vector<double> y(x.size());
  double z0 = zi[0];
  double z1 = zi[1];
  for (std::size_t i = 0; i < x.size(); ++i)
  {
    double const out = c.b[0] * x[i] + z0;
    z0 = c.b[1] * x[i] - c.a[1] * out + z1;
    z1 = c.b[2] * x[i] - c.a[2] * out;
    y[i] = out;
  }
  return y;
}

std::vector<double> ButterworthFilter::filtfilt(const Coefficients& c,
                                                std::span<const double> x)
{
  std::size_t const n = x.size();
  if (n < 2)
  {
    return {x.begin(), x.end()};
  }
  std::size_t const pad = std::min(kMaxPadLength, n - 1);

  // Odd extension about both end points
  std::vector<double> ext;
  ext.reserve(n + 2 * pad);
  for (std::size_t k = pad; k >= 1; --k)
  {
    ext.push_back(2.0 * x[0] - x[k]);
  }
  ext.insert(ext.end(), x.begin(), x.end());
  for (std::size_t k = 1; k <= pad; ++k)
  {
    ext.push_back(2.0 * x[n - 1] - x[n - 1 - k]);
  }

  auto const zi = steadyState(c);

  auto forward = lfilter(c, ext, {zi[0] * ext.front(), zi[1] * ext.front()});
  std::reverse(forward.begin(), forward.end());
  double const y0 = forward.front();
  auto backward = lfilter(c, forward, {zi[0] * y0, zi[1] * y0});
  std::reverse(backward.begin(), backward.end());

  return {backward.begin() + static_cast<std::ptrdiff_t>(pad),
          backward.begin() + static_cast<std::ptrdiff_t>(pad + n)};
}

std::vector<double> ButterworthFilter::lowpass(std::span<const double> x,
                                               double cutoffHz,
                                               double fs)
{
  return filtfilt(design(cutoffHz, fs), x);
}

}  // namespace mocap_core
