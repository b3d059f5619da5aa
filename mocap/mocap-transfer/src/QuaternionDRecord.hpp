#ifndef MOCAP_TRANSFER_QUATERNIOND_RECORD_HPP
#define MOCAP_TRANSFER_QUATERNIOND_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace mocap_transfer
{

/**
 * @brief Database record for an orientation quaternion
 *
 * Components are stored as scalar columns in (w, x, y, z) order, Hamilton
 * convention. Missing samples keep the NaN defaults.
 */
struct QuaternionDRecord : public cpp_sqlite::BaseTransferObject
{
  double w{std::numeric_limits<double>::quiet_NaN()};
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(QuaternionDRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (w, x, y, z));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_QUATERNIOND_RECORD_HPP
