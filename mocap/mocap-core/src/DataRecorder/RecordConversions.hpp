// Ticket: 0017_session_recorder

#ifndef MOCAP_CORE_RECORD_CONVERSIONS_HPP
#define MOCAP_CORE_RECORD_CONVERSIONS_HPP

#include <map>
#include <string>

#include <Eigen/Dense>

#include "mocap-core/src/Calibration/CalibrationEngine.hpp"
#include "mocap-core/src/DataTypes/Quaternion.hpp"
#include "mocap-core/src/Filtering/PositionFilter.hpp"
#include "mocap-core/src/Gates/BurstClassifier.hpp"
#include "mocap-core/src/Gates/GateVerdict.hpp"
#include "mocap-transfer/src/BurstEventRecord.hpp"
#include "mocap-transfer/src/CalibrationOffsetRecord.hpp"
#include "mocap-transfer/src/FilterDecisionRecord.hpp"
#include "mocap-transfer/src/GateVerdictRecord.hpp"
#include "mocap-transfer/src/QuaternionDRecord.hpp"
#include "mocap-transfer/src/Vector3DRecord.hpp"

namespace mocap_core
{

/**
 * @brief Conversions from stage artifacts to transfer records
 *
 * Foreign keys are left unset; the recorder assigns them.
 *
 * @ticket 0017_session_recorder
 */

[[nodiscard]] mocap_transfer::QuaternionDRecord toRecord(const QuaternionD& q);

[[nodiscard]] mocap_transfer::Vector3DRecord toRecord(const Eigen::Vector3d& v);

[[nodiscard]] mocap_transfer::CalibrationOffsetRecord toRecord(
  const CalibrationOffset& offset,
  const CalibrationResult& calibration);

[[nodiscard]] mocap_transfer::FilterDecisionRecord toRecord(
  const FilterDecision& decision);

[[nodiscard]] mocap_transfer::GateVerdictRecord toRecord(const GateVerdict& verdict);

[[nodiscard]] mocap_transfer::BurstEventRecord toRecord(const BurstEvent& event);

// "key=value;key=value" in key order
[[nodiscard]] std::string flattenMetrics(const std::map<std::string, double>& metrics);

}  // namespace mocap_core

#endif  // MOCAP_CORE_RECORD_CONVERSIONS_HPP
