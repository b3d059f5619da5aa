// Ticket: 0001_quaternion_kernel
// Base CRTP template for orientation quaternion types

#ifndef MOCAP_CORE_QUATD_BASE_HPP
#define MOCAP_CORE_QUATD_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <cmath>

#include <Eigen/Geometry>

namespace mocap_core::detail
{

/**
 * @brief CRTP base class for orientation quaternion types
 *
 * Wraps Eigen::Quaterniond via composition (not inheritance, since
 * Eigen::Quaterniond is not a matrix type). Unlike Eigen, the sign of the
 * quaternion is treated as meaningful storage: q and -q describe the same
 * rotation, but sequences must keep a consistent sign for interpolation and
 * differentiation, so negated() and dot() are exposed directly.
 *
 * Uses Eigen/Hamilton convention: q = w + xi + yj + zk
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class QuatDBase
{
public:
  // Identity quaternion (w=1, x=y=z=0)
  QuatDBase() : quat_{Eigen::Quaterniond::Identity()}
  {
  }

  // Construct from components (w, x, y, z) - Eigen convention
  QuatDBase(double w, double x, double y, double z) : quat_{w, x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  QuatDBase(const Eigen::Quaterniond& quat) : quat_{quat}
  {
  }

  QuatDBase& operator=(const Eigen::Quaterniond& other)
  {
    quat_ = other;
    return *this;
  }

  [[nodiscard]] double w() const
  {
    return quat_.w();
  }
  [[nodiscard]] double x() const
  {
    return quat_.x();
  }
  [[nodiscard]] double y() const
  {
    return quat_.y();
  }
  [[nodiscard]] double z() const
  {
    return quat_.z();
  }

  double& w()
  {
    return quat_.w();
  }
  double& x()
  {
    return quat_.x();
  }
  double& y()
  {
    return quat_.y();
  }
  double& z()
  {
    return quat_.z();
  }

  [[nodiscard]] const Eigen::Quaterniond& eigen() const
  {
    return quat_;
  }

  [[nodiscard]] Eigen::Quaterniond& eigen()
  {
    return quat_;
  }

  // Hamilton product
  [[nodiscard]] Derived operator*(const QuatDBase& other) const
  {
    return Derived{quat_ * other.quat_};
  }

  // Rotate a vector
  [[nodiscard]] Eigen::Vector3d operator*(const Eigen::Vector3d& v) const
  {
    return quat_ * v;
  }

  // Conjugate (equals the inverse for unit quaternions)
  [[nodiscard]] Derived conjugate() const
  {
    return Derived{quat_.conjugate()};
  }

  // Same rotation, opposite hemisphere
  [[nodiscard]] Derived negated() const
  {
    return Derived{-quat_.w(), -quat_.x(), -quat_.y(), -quat_.z()};
  }

  // 4D inner product, used for hemisphere tests
  [[nodiscard]] double dot(const QuatDBase& other) const
  {
    return quat_.coeffs().dot(other.quat_.coeffs());
  }

  [[nodiscard]] double norm() const
  {
    return quat_.norm();
  }

  [[nodiscard]] double squaredNorm() const
  {
    return quat_.squaredNorm();
  }

  [[nodiscard]] bool allFinite() const
  {
    return quat_.coeffs().allFinite();
  }

  // Component vector in (w, x, y, z) order
  [[nodiscard]] Eigen::Vector4d wxyz() const
  {
    return Eigen::Vector4d{quat_.w(), quat_.x(), quat_.y(), quat_.z()};
  }

  [[nodiscard]] Eigen::Matrix3d toRotationMatrix() const
  {
    return quat_.toRotationMatrix();
  }

  // Rule of Zero
  QuatDBase(const QuatDBase&) = default;
  QuatDBase(QuatDBase&&) noexcept = default;
  QuatDBase& operator=(const QuatDBase&) = default;
  QuatDBase& operator=(QuatDBase&&) noexcept = default;
  ~QuatDBase() = default;

protected:
  Eigen::Quaterniond quat_;
};

}  // namespace mocap_core::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // MOCAP_CORE_QUATD_BASE_HPP
