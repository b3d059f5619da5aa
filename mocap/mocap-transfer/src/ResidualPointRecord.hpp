// Ticket: 0017_session_recorder

#ifndef MOCAP_TRANSFER_RESIDUAL_POINT_RECORD_HPP
#define MOCAP_TRANSFER_RESIDUAL_POINT_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "mocap-transfer/src/FilterDecisionRecord.hpp"

namespace mocap_transfer
{

/**
 * @brief One point of the residual RMS curve
 *
 * @ticket 0017_session_recorder
 */
struct ResidualPointRecord : public cpp_sqlite::BaseTransferObject
{
  double frequency_hz{0.0};
  double residual_rms{0.0};  // [mm]
  cpp_sqlite::ForeignKey<FilterDecisionRecord> decision;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(ResidualPointRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (frequency_hz, residual_rms, decision));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_RESIDUAL_POINT_RECORD_HPP
