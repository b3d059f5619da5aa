#ifndef MOCAP_TRANSFER_VECTOR3D_RECORD_HPP
#define MOCAP_TRANSFER_VECTOR3D_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace mocap_transfer
{

/**
 * @brief Database record for a 3D vector
 *
 * Used for rotation vectors, angular rates and linear derivatives. Units
 * are those of the owning record's field.
 */
struct Vector3DRecord : public cpp_sqlite::BaseTransferObject
{
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(Vector3DRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (x, y, z));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_VECTOR3D_RECORD_HPP
