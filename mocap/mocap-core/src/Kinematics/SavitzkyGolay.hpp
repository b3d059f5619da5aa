// Ticket: 0012_kinematics_derivation

#ifndef MOCAP_CORE_SAVITZKY_GOLAY_HPP
#define MOCAP_CORE_SAVITZKY_GOLAY_HPP

#include <cstddef>
#include <span>
#include <vector>

#include <Eigen/Dense>

namespace mocap_core
{

/**
 * @brief Savitzky-Golay smoothing differentiator
 *
 * Interior samples use the least-squares convolution coefficients of a
 * centred window. The first and last half-windows are evaluated from a
 * polynomial fitted to the edge window, so the output has the same length as
 * the input and no padding is invented.
 *
 * @ticket 0012_kinematics_derivation
 */
class SavitzkyGolay
{
public:
  static constexpr std::size_t kMinWindow = 5;

  /**
   * @brief Window length for a duration in seconds
   *
   * round(seconds * fs), raised to max(5, polyorder + 2) and made odd.
   */
  [[nodiscard]] static std::size_t windowFromSeconds(double seconds,
                                                     double fs,
                                                     int polyorder);

  /**
   * @brief Shrink a window to fit a signal of n samples
   *
   * @throws std::invalid_argument if no odd window >= polyorder + 2 fits
   */
  [[nodiscard]] static std::size_t fitWindow(std::size_t window,
                                             std::size_t n,
                                             int polyorder);

  /**
   * @brief Convolution coefficients for the centre sample
   *
   * Output is sum_k c[k] * x[t - h + k] with h = window / 2.
   *
   * @throws std::invalid_argument if window is even, polyorder >= window or
   *         deriv > polyorder
   */
  [[nodiscard]] static Eigen::VectorXd coefficients(std::size_t window,
                                                    int polyorder,
                                                    int deriv,
                                                    double delta);

  /**
   * @brief Smoothed derivative of order deriv with sample spacing delta
   *
   * @throws std::invalid_argument if the signal is shorter than the window
   */
  [[nodiscard]] static std::vector<double> apply(std::span<const double> x,
                                                 std::size_t window,
                                                 int polyorder,
                                                 int deriv,
                                                 double delta);

  // Column-wise apply on an N x 3 signal
  [[nodiscard]] static Eigen::MatrixX3d apply(const Eigen::MatrixX3d& x,
                                              std::size_t window,
                                              int polyorder,
                                              int deriv,
                                              double delta);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_SAVITZKY_GOLAY_HPP
