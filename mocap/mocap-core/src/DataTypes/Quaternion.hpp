// Ticket: 0001_quaternion_kernel
// Orientation quaternion used by every pipeline stage

#ifndef MOCAP_CORE_QUATERNION_HPP
#define MOCAP_CORE_QUATERNION_HPP

#include <limits>
#include <vector>

#include "mocap-core/src/DataTypes/QuatDBase.hpp"

namespace mocap_core
{

/**
 * @brief Orientation quaternion (w, x, y, z)
 *
 * Thin wrapper around Eigen::Quaterniond. Normalization, hemisphere handling
 * and log/exp maps live in QuaternionOps so that there is exactly one place
 * where the q / -q ambiguity is resolved.
 *
 * Memory footprint: 32 bytes (same as Eigen::Quaterniond)
 */
struct QuaternionD final : detail::QuatDBase<QuaternionD>
{
  using QuatDBase::QuatDBase;
  using QuatDBase::operator=;

  QuaternionD() = default;

  // Missing-sample marker (all components NaN)
  static QuaternionD missing()
  {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    return QuaternionD{nan, nan, nan, nan};
  }

  // Rule of Zero
  QuaternionD(const QuaternionD&) = default;
  QuaternionD(QuaternionD&&) noexcept = default;
  QuaternionD& operator=(const QuaternionD&) = default;
  QuaternionD& operator=(QuaternionD&&) noexcept = default;
  ~QuaternionD() = default;
};

using QuaternionSeries = std::vector<QuaternionD>;

}  // namespace mocap_core

#endif  // MOCAP_CORE_QUATERNION_HPP
