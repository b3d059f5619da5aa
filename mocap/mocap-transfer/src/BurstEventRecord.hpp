// Ticket: 0017_session_recorder

#ifndef MOCAP_TRANSFER_BURST_EVENT_RECORD_HPP
#define MOCAP_TRANSFER_BURST_EVENT_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "mocap-transfer/src/RunRecord.hpp"

namespace mocap_transfer
{

/**
 * @brief One high-velocity event classified by Gate 5
 *
 * @ticket 0017_session_recorder
 */
struct BurstEventRecord : public cpp_sqlite::BaseTransferObject
{
  std::string joint_name;
  uint32_t start_frame{0};
  uint32_t end_frame{0};  // exclusive
  uint32_t duration_frames{0};
  double duration_ms{0.0};
  double max_velocity_deg_s{0.0};
  double mean_velocity_deg_s{0.0};
  std::string tier;    // ARTIFACT, BURST or FLOW
  std::string status;  // REVIEW or ACCEPT_HIGH_INTENSITY
  std::string action;  // EXCLUDE, INCLUDE_FLAGGED or INCLUDE
  cpp_sqlite::ForeignKey<RunRecord> run;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(BurstEventRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (joint_name,
                       start_frame,
                       end_frame,
                       duration_frames,
                       duration_ms,
                       max_velocity_deg_s,
                       mean_velocity_deg_s,
                       tier,
                       status,
                       action,
                       run));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_BURST_EVENT_RECORD_HPP
