// Ticket: 0006_temporal_resampler

#include "mocap-core/src/Resampling/Interpolation.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"

namespace mocap_core
{

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

int sign(double v)
{
  return (v > 0.0) - (v < 0.0);
}

void requireIncreasing(std::span<const double> x, const char* who)
{
  for (std::size_t i = 1; i < x.size(); ++i)
  {
    if (!(x[i] > x[i - 1]))
    {
      throw std::invalid_argument{std::string{who} +
                                  ": knots must be strictly increasing"};
    }
  }
}

// Index k such that x[k] <= xq <= x[k+1]; caller guarantees xq in range
std::size_t segmentIndex(std::span<const double> x, double xq)
{
  auto it = std::upper_bound(x.begin(), x.end(), xq);
  auto k = static_cast<std::size_t>(std::distance(x.begin(), it));
  if (k == 0)
  {
    return 0;
  }
  return std::min(k - 1, x.size() - 2);
}

// Three-point end slope with the shape-preserving limits
double endSlope(double h0, double h1, double d0, double d1)
{
  double slope = ((2.0 * h0 + h1) * d0 - h0 * d1) / (h0 + h1);
  if (sign(slope) != sign(d0))
  {
    slope = 0.0;
  }
  else if (sign(d0) != sign(d1) && std::abs(slope) > 3.0 * std::abs(d0))
  {
    slope = 3.0 * d0;
  }
  return slope;
}

}  // namespace

// ========== MonotoneCubic ==========

MonotoneCubic::MonotoneCubic(std::vector<double> x, std::vector<double> y)
  : x_{std::move(x)}, y_{std::move(y)}
{
  if (x_.size() != y_.size())
  {
    throw std::invalid_argument{"MonotoneCubic: x and y sizes differ"};
  }
  if (x_.size() < 2)
  {
    throw std::invalid_argument{"MonotoneCubic: need at least two knots"};
  }
  requireIncreasing(x_, "MonotoneCubic");

  std::size_t const n = x_.size();
  std::vector<double> h(n - 1);
  std::vector<double> delta(n - 1);
  for (std::size_t k = 0; k + 1 < n; ++k)
  {
    h[k] = x_[k + 1] - x_[k];
    delta[k] = (y_[k + 1] - y_[k]) / h[k];
  }

  slopes_.assign(n, 0.0);
  if (n == 2)
  {
    slopes_[0] = delta[0];
    slopes_[1] = delta[0];
    return;
  }

  for (std::size_t k = 1; k + 1 < n; ++k)
  {
    if (sign(delta[k - 1]) * sign(delta[k]) <= 0)
    {
      slopes_[k] = 0.0;
      continue;
    }
    double const w1 = 2.0 * h[k] + h[k - 1];
    double const w2 = h[k] + 2.0 * h[k - 1];
    slopes_[k] = (w1 + w2) / (w1 / delta[k - 1] + w2 / delta[k]);
  }

  slopes_[0] = endSlope(h[0], h[1], delta[0], delta[1]);
  slopes_[n - 1] = endSlope(h[n - 2], h[n - 3], delta[n - 2], delta[n - 3]);
}

double MonotoneCubic::operator()(double xq) const
{
  if (!(xq >= x_.front() && xq <= x_.back()))
  {
    return kNaN;
  }
  std::size_t const k = segmentIndex(x_, xq);
  double const h = x_[k + 1] - x_[k];
  double const t = (xq - x_[k]) / h;
  double const t2 = t * t;
  double const t3 = t2 * t;

  double const h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
  double const h10 = t3 - 2.0 * t2 + t;
  double const h01 = -2.0 * t3 + 3.0 * t2;
  double const h11 = t3 - t2;

  return h00 * y_[k] + h10 * h * slopes_[k] + h01 * y_[k + 1] +
         h11 * h * slopes_[k + 1];
}

std::vector<double> MonotoneCubic::evaluate(std::span<const double> xq) const
{
  std::vector<double> out;
  out.reserve(xq.size());
  for (double const q : xq)
  {
    out.push_back((*this)(q));
  }
  return out;
}

// ========== Interpolation ==========

std::vector<double> Interpolation::linear(std::span<const double> x,
                                          std::span<const double> y,
                                          std::span<const double> xq)
{
  if (x.size() != y.size())
  {
    throw std::invalid_argument{"Interpolation: x and y sizes differ"};
  }
  requireIncreasing(x, "Interpolation");

  std::vector<double> out(xq.size(), kNaN);
  if (x.empty())
  {
    return out;
  }
  if (x.size() == 1)
  {
    for (std::size_t i = 0; i < xq.size(); ++i)
    {
      if (xq[i] == x[0])
      {
        out[i] = y[0];
      }
    }
    return out;
  }

  for (std::size_t i = 0; i < xq.size(); ++i)
  {
    double const q = xq[i];
    if (!(q >= x.front() && q <= x.back()))
    {
      continue;
    }
    std::size_t const k = segmentIndex(x, q);
    double const t = (q - x[k]) / (x[k + 1] - x[k]);
    out[i] = y[k] + t * (y[k + 1] - y[k]);
  }
  return out;
}

QuaternionSeries Interpolation::slerp(std::span<const double> times,
                                      std::span<const QuaternionD> keys,
                                      std::span<const double> xq)
{
  if (times.size() != keys.size())
  {
    throw std::invalid_argument{
      "Interpolation: orientation keyframe and time sizes differ"};
  }
  requireIncreasing(times, "Interpolation");

  QuaternionSeries out(xq.size(), QuaternionD::missing());
  if (keys.empty())
  {
    return out;
  }

  auto const prepared =
    QuaternionOps::enforceContinuity(QuaternionOps::normalizeSeries(keys));

  for (std::size_t i = 0; i < xq.size(); ++i)
  {
    double const q = xq[i];
    if (!(q >= times.front() && q <= times.back()))
    {
      continue;
    }
    if (prepared.size() == 1)
    {
      out[i] = prepared[0];
      continue;
    }
    std::size_t const k = segmentIndex(times, q);
    double const t = (q - times[k]) / (times[k + 1] - times[k]);
    out[i] = QuaternionOps::slerp(prepared[k], prepared[k + 1], t);
  }

  return QuaternionOps::enforceContinuity(QuaternionOps::enforceShortest(out));
}

}  // namespace mocap_core
