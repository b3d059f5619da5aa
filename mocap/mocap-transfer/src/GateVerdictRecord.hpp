// Ticket: 0017_session_recorder

#ifndef MOCAP_TRANSFER_GATE_VERDICT_RECORD_HPP
#define MOCAP_TRANSFER_GATE_VERDICT_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "mocap-transfer/src/RunRecord.hpp"

namespace mocap_transfer
{

/**
 * @brief Verdict of one quality gate
 *
 * Gate-specific metrics are flattened into "key=value" pairs separated by
 * semicolons.
 *
 * @ticket 0017_session_recorder
 */
struct GateVerdictRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t gate{0};
  std::string name;
  std::string status;
  std::string reason;
  std::string metrics;
  cpp_sqlite::ForeignKey<RunRecord> run;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(GateVerdictRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (gate, name, status, reason, metrics, run));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_GATE_VERDICT_RECORD_HPP
