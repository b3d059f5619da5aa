// Ticket: 0012_kinematics_derivation

#include "mocap-core/src/Kinematics/SavitzkyGolay.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mocap_core
{

namespace
{

void validate(std::size_t window, int polyorder, int deriv)
{
  if (window % 2 == 0)
  {
    throw std::invalid_argument{"SavitzkyGolay: window length must be odd"};
  }
  if (polyorder < 0 || static_cast<std::size_t>(polyorder) >= window)
  {
    throw std::invalid_argument{
      "SavitzkyGolay: polyorder must be less than the window length"};
  }
  if (deriv < 0 || deriv > polyorder)
  {
    throw std::invalid_argument{
      "SavitzkyGolay: derivative order exceeds polyorder"};
  }
}

// Vandermonde matrix with rows (x0 + i)^k
Eigen::MatrixXd vandermonde(std::size_t window, int polyorder, double x0)
{
  Eigen::MatrixXd A(static_cast<Eigen::Index>(window), polyorder + 1);
  for (Eigen::Index i = 0; i < A.rows(); ++i)
  {
    double const xi = x0 + static_cast<double>(i);
    double p = 1.0;
    for (int k = 0; k <= polyorder; ++k)
    {
      A(i, k) = p;
      p *= xi;
    }
  }
  return A;
}

// d-th derivative of sum_k c_k x^k at x
double polyDerivative(const Eigen::VectorXd& c, int deriv, double x)
{
  double value = 0.0;
  for (Eigen::Index k = deriv; k < c.size(); ++k)
  {
    double factor = 1.0;
    for (Eigen::Index m = 0; m < deriv; ++m)
    {
      factor *= static_cast<double>(k - m);
    }
    value += factor * c(k) * std::pow(x, static_cast<double>(k - deriv));
  }
  return value;
}

double factorial(int n)
{
  double f = 1.0;
  for (int i = 2; i <= n; ++i)
  {
    f *= static_cast<double>(i);
  }
  return f;
}

}  // namespace

std::size_t SavitzkyGolay::windowFromSeconds(double seconds, double fs, int polyorder)
{
  if (!(seconds > 0.0) || !(fs > 0.0) || polyorder < 0)
  {
    throw std::invalid_argument{
      "SavitzkyGolay: window seconds, rate and polyorder must be positive"};
  }
  auto window = static_cast<std::size_t>(std::lround(seconds * fs));
  window = std::max({window, kMinWindow, static_cast<std::size_t>(polyorder + 2)});
  if (window % 2 == 0)
  {
    ++window;
  }
  return window;
}

std::size_t SavitzkyGolay::fitWindow(std::size_t window, std::size_t n, int polyorder)
{
  std::size_t fitted = std::min(window, n);
  if (fitted % 2 == 0 && fitted > 0)
  {
    --fitted;
  }
  if (fitted < static_cast<std::size_t>(polyorder + 2))
  {
    throw std::invalid_argument{
      "SavitzkyGolay: signal too short for the smoothing window"};
  }
  return fitted;
}

Eigen::VectorXd SavitzkyGolay::coefficients(std::size_t window,
                                            int polyorder,
                                            int deriv,
                                            double delta)
{
  validate(window, polyorder, deriv);
  double const half = static_cast<double>(window / 2);
  Eigen::MatrixXd const A = vandermonde(window, polyorder, -half);

  // Row deriv of pinv(A) gives the deriv-th polynomial coefficient
  Eigen::MatrixXd const pinv =
    A.colPivHouseholderQr().solve(Eigen::MatrixXd::Identity(A.rows(), A.rows()));
  return pinv.row(deriv).transpose() * factorial(deriv) / std::pow(delta, deriv);
}

std::vector<double> SavitzkyGolay::apply(std::span<const double> x,
                                         std::size_t window,
                                         int polyorder,
                                         int deriv,
                                         double delta)
{
  validate(window, polyorder, deriv);
  if (!(delta > 0.0))
  {
    throw std::invalid_argument{"SavitzkyGolay: sample spacing must be positive"};
  }
  if (x.size() < window)
  {
    throw std::invalid_argument{
      "SavitzkyGolay: signal is shorter than the smoothing window"};
  }

  std::size_t const n = x.size();
  std::size_t const h = window / 2;
  Eigen::VectorXd const c = coefficients(window, polyorder, deriv, delta);

  std::vector<double> out(n, 0.0);
  for (std::size_t t = h; t + h < n; ++t)
  {
    double acc = 0.0;
    for (std::size_t k = 0; k < window; ++k)
    {
      acc += c(static_cast<Eigen::Index>(k)) * x[t - h + k];
    }
    out[t] = acc;
  }

  // Edge windows: fit on local abscissa 0..window-1
  Eigen::MatrixXd const A = vandermonde(window, polyorder, 0.0);
  auto const qr = A.colPivHouseholderQr();
  double const scale = std::pow(delta, deriv);
  auto const w = static_cast<Eigen::Index>(window);

  Eigen::VectorXd head(w);
  Eigen::VectorXd tail(w);
  for (Eigen::Index k = 0; k < w; ++k)
  {
    head(k) = x[static_cast<std::size_t>(k)];
    tail(k) = x[n - window + static_cast<std::size_t>(k)];
  }
  Eigen::VectorXd const headFit = qr.solve(head);
  Eigen::VectorXd const tailFit = qr.solve(tail);
  for (std::size_t k = 0; k < h; ++k)
  {
    out[k] = polyDerivative(headFit, deriv, static_cast<double>(k)) / scale;
    std::size_t const local = window - h + k;
    out[n - h + k] = polyDerivative(tailFit, deriv, static_cast<double>(local)) / scale;
  }
  return out;
}

Eigen::MatrixX3d SavitzkyGolay::apply(const Eigen::MatrixX3d& x,
                                      std::size_t window,
                                      int polyorder,
                                      int deriv,
                                      double delta)
{
  Eigen::MatrixX3d out(x.rows(), 3);
  std::vector<double> column(static_cast<std::size_t>(x.rows()));
  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    for (Eigen::Index i = 0; i < x.rows(); ++i)
    {
      column[static_cast<std::size_t>(i)] = x(i, axis);
    }
    auto const d = apply(column, window, polyorder, deriv, delta);
    for (Eigen::Index i = 0; i < x.rows(); ++i)
    {
      out(i, axis) = d[static_cast<std::size_t>(i)];
    }
  }
  return out;
}

}  // namespace mocap_core
