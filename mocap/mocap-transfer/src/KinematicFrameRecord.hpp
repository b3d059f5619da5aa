// Ticket: 0017_session_recorder

#ifndef MOCAP_TRANSFER_KINEMATIC_FRAME_RECORD_HPP
#define MOCAP_TRANSFER_KINEMATIC_FRAME_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "mocap-transfer/src/QuaternionDRecord.hpp"
#include "mocap-transfer/src/RunRecord.hpp"
#include "mocap-transfer/src/Vector3DRecord.hpp"

namespace mocap_transfer
{

/**
 * @brief Derived kinematics of one joint at one frame
 *
 * Angular fields are in degrees, linear fields in mm. The status code is the
 * Gate 5 frame mask (0 normal, 1 artifact, 2 burst, 3 flow).
 *
 * @ticket 0017_session_recorder
 */
struct KinematicFrameRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t frame_index{0};
  double time{0.0};  // [s]
  std::string joint_name;

  QuaternionDRecord zeroed_orientation;
  Vector3DRecord rotation_vector;       // [deg]
  Vector3DRecord angular_velocity;      // [deg/s]
  Vector3DRecord angular_acceleration;  // [deg/s^2]
  Vector3DRecord linear_velocity;       // world [mm/s]
  Vector3DRecord linear_acceleration;   // world [mm/s^2]
  Vector3DRecord root_relative_position;  // [mm]
  uint32_t status_code{0};

  cpp_sqlite::ForeignKey<RunRecord> run;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(KinematicFrameRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (frame_index,
                       time,
                       joint_name,
                       zeroed_orientation,
                       rotation_vector,
                       angular_velocity,
                       angular_acceleration,
                       linear_velocity,
                       linear_acceleration,
                       root_relative_position,
                       status_code,
                       run));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_KINEMATIC_FRAME_RECORD_HPP
