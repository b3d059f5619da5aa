// Ticket: 0001_quaternion_kernel

#ifndef MOCAP_CORE_QUATERNION_OPS_HPP
#define MOCAP_CORE_QUATERNION_OPS_HPP

#include <cstddef>
#include <span>

#include <Eigen/Dense>

#include "mocap-core/src/DataTypes/Quaternion.hpp"

namespace mocap_core
{

/**
 * @brief Quaternion algebra kernel shared by every pipeline stage
 *
 * Single point where normalization and the q / -q double cover are handled.
 * Resampling, calibration, differentiation and repair all call through here
 * instead of normalizing locally, so a sign flip can never leak into an
 * interpolation or a derivative as a phantom 360 degree jump.
 *
 * Missing samples (NaN components) propagate through every operation and are
 * skipped by the sequence operations.
 *
 * @ticket 0001_quaternion_kernel
 */
class QuaternionOps
{
public:
  // Norm floor used by normalize()
  static constexpr double kNormEpsilon = 1e-12;

  // Below this vector-part norm the log/exp maps use the small-angle form
  static constexpr double kSmallAngle = 1e-12;

  /**
   * @brief Divide by the norm, with the norm floored at kNormEpsilon
   */
  [[nodiscard]] static QuaternionD normalize(const QuaternionD& q);

  /**
   * @brief Inverse of a unit quaternion (conjugate of the normalized input)
   */
  [[nodiscard]] static QuaternionD invert(const QuaternionD& q);

  /**
   * @brief Hamilton product a * b
   */
  [[nodiscard]] static QuaternionD compose(const QuaternionD& a,
                                           const QuaternionD& b);

  /**
   * @brief Flip sign when the scalar part is negative
   */
  [[nodiscard]] static QuaternionD shortest(const QuaternionD& q);

  /**
   * @brief Rotation vector (axis * angle) [rad], angle in [0, pi]
   *
   * The input is normalized and moved into the w >= 0 hemisphere first.
   */
  [[nodiscard]] static Eigen::Vector3d toRotationVector(const QuaternionD& q);

  /**
   * @brief Unit quaternion from a rotation vector [rad] (exp map)
   */
  [[nodiscard]] static QuaternionD fromRotationVector(const Eigen::Vector3d& rv);

  /**
   * @brief Rotation angle of q [rad], in [0, pi]
   */
  [[nodiscard]] static double angle(const QuaternionD& q);

  /**
   * @brief Geodesic angle between two orientations [rad], in [0, pi]
   */
  [[nodiscard]] static double angleBetween(const QuaternionD& a,
                                           const QuaternionD& b);

  /**
   * @brief Spherical linear interpolation along the shorter arc
   *
   * @param t Fraction in [0, 1]; 0 returns a, 1 returns b (up to sign)
   */
  [[nodiscard]] static QuaternionD slerp(const QuaternionD& a,
                                         const QuaternionD& b,
                                         double t);

  // ========== Sequence operations ==========

  [[nodiscard]] static QuaternionSeries normalizeSeries(
    std::span<const QuaternionD> series);

  [[nodiscard]] static QuaternionSeries enforceShortest(
    std::span<const QuaternionD> series);

  /**
   * @brief Enforce temporal hemisphere continuity
   *
   * Each sample is flipped when its dot product with the previous valid
   * sample is negative. NaN samples are left untouched and skipped.
   * Afterwards every consecutive pair of valid samples has dot >= 0.
   */
  [[nodiscard]] static QuaternionSeries enforceContinuity(
    std::span<const QuaternionD> series);

  /**
   * @brief Number of consecutive valid pairs with negative dot product
   */
  [[nodiscard]] static std::size_t countDiscontinuities(
    std::span<const QuaternionD> series);

  // Smallest dot product over consecutive valid pairs (1.0 if none)
  [[nodiscard]] static double minConsecutiveDot(
    std::span<const QuaternionD> series);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_QUATERNION_OPS_HPP
