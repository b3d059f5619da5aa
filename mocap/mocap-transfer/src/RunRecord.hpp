// Ticket: 0017_session_recorder

#ifndef MOCAP_TRANSFER_RUN_RECORD_HPP
#define MOCAP_TRANSFER_RUN_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace mocap_transfer
{

/**
 * @brief One processed recording
 *
 * Every other record references its run via ForeignKey<RunRecord>.
 *
 * @ticket 0017_session_recorder
 */
struct RunRecord : public cpp_sqlite::BaseTransferObject
{
  std::string run_id;
  double sampling_rate{0.0};  // Grid rate [Hz]
  uint32_t frame_count{0};
  uint32_t joint_count{0};
  double duration_s{0.0};
  double source_jitter_ms{0.0};
  double max_norm_error{0.0};
  std::string overall_status;  // PASS, ACCEPT_HIGH_INTENSITY, REVIEW, REJECT
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(RunRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (run_id,
                       sampling_rate,
                       frame_count,
                       joint_count,
                       duration_s,
                       source_jitter_ms,
                       max_norm_error,
                       overall_status));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_RUN_RECORD_HPP
