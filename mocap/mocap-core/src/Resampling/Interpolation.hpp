// Ticket: 0006_temporal_resampler

#ifndef MOCAP_CORE_INTERPOLATION_HPP
#define MOCAP_CORE_INTERPOLATION_HPP

#include <span>
#include <vector>

#include "mocap-core/src/DataTypes/Quaternion.hpp"

namespace mocap_core
{

/**
 * @brief Piecewise cubic Hermite interpolating polynomial (monotone cubic)
 *
 * Fritsch-Carlson derivative estimate with harmonic-mean weighting and the
 * one-sided three-point end conditions, so the interpolant never overshoots
 * between knots. Queries outside [x.front(), x.back()] return NaN.
 *
 * @ticket 0006_temporal_resampler
 */
class MonotoneCubic
{
public:
  /**
   * @param x Strictly increasing knots (at least two)
   * @param y Values at the knots
   * @throws std::invalid_argument on size mismatch, fewer than two knots or
   *         non-increasing x
   */
  MonotoneCubic(std::vector<double> x, std::vector<double> y);

  [[nodiscard]] double operator()(double xq) const;

  [[nodiscard]] std::vector<double> evaluate(std::span<const double> xq) const;

private:
  std::vector<double> x_;
  std::vector<double> y_;
  std::vector<double> slopes_;
};

/**
 * @brief Interpolation helpers that never extrapolate
 *
 * @ticket 0006_temporal_resampler
 */
class Interpolation
{
public:
  /**
   * @brief Piecewise-linear interpolation, NaN outside [x.front(), x.back()]
   */
  [[nodiscard]] static std::vector<double> linear(std::span<const double> x,
                                                  std::span<const double> y,
                                                  std::span<const double> xq);

  /**
   * @brief Slerp a keyframed orientation sequence onto query times
   *
   * Keyframes are normalized and made hemisphere-continuous before
   * interpolating. Queries outside [times.front(), times.back()] return a
   * missing quaternion. The output is anchored in the w >= 0 hemisphere and
   * made continuous from there.
   *
   * @throws std::invalid_argument on size mismatch or unsorted times
   */
  [[nodiscard]] static QuaternionSeries slerp(std::span<const double> times,
                                              std::span<const QuaternionD> keys,
                                              std::span<const double> xq);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_INTERPOLATION_HPP
