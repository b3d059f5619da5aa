#ifndef MOCAP_TRANSFER_RECORDS_HPP
#define MOCAP_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all database transfer objects
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "mocap-transfer/src/BurstEventRecord.hpp"
#include "mocap-transfer/src/CalibrationOffsetRecord.hpp"
#include "mocap-transfer/src/FilterDecisionRecord.hpp"
#include "mocap-transfer/src/GateVerdictRecord.hpp"
#include "mocap-transfer/src/KinematicFrameRecord.hpp"
#include "mocap-transfer/src/QuaternionDRecord.hpp"
#include "mocap-transfer/src/ResidualPointRecord.hpp"
#include "mocap-transfer/src/RunRecord.hpp"
#include "mocap-transfer/src/Vector3DRecord.hpp"

namespace mocap_transfer
{

using Database = cpp_sqlite::Database;

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_RECORDS_HPP
