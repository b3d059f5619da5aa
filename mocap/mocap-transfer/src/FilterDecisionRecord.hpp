// Ticket: 0017_session_recorder

#ifndef MOCAP_TRANSFER_FILTER_DECISION_RECORD_HPP
#define MOCAP_TRANSFER_FILTER_DECISION_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "mocap-transfer/src/RunRecord.hpp"

namespace mocap_transfer
{

/**
 * @brief How the position low-pass cutoff was chosen for a run
 *
 * The residual curve is stored as ResidualPointRecord rows that reference
 * this record.
 *
 * @ticket 0017_session_recorder
 */
struct FilterDecisionRecord : public cpp_sqlite::BaseTransferObject
{
  std::string mode;  // GLOBAL, PER_REGION or FIXED
  double cutoff_hz{0.0};
  double search_min_hz{0.0};
  double search_max_hz{0.0};
  std::string method;
  std::string representative_signals;  // comma separated
  double residual_rms_final{0.0};
  uint32_t failed{0};
  std::string failure_reason;
  uint32_t passthrough_channels{0};
  uint32_t partial_channels{0};
  uint32_t excluded_channels{0};

  cpp_sqlite::ForeignKey<RunRecord> run;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(FilterDecisionRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (mode,
                       cutoff_hz,
                       search_min_hz,
                       search_max_hz,
                       method,
                       representative_signals,
                       residual_rms_final,
                       failed,
                       failure_reason,
                       passthrough_channels,
                       partial_channels,
                       excluded_channels,
                       run));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_FILTER_DECISION_RECORD_HPP
