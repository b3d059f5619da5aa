// Ticket: 0017_session_recorder

#ifndef MOCAP_TRANSFER_CALIBRATION_OFFSET_RECORD_HPP
#define MOCAP_TRANSFER_CALIBRATION_OFFSET_RECORD_HPP

#include <cstdint>
#include <limits>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "mocap-transfer/src/QuaternionDRecord.hpp"
#include "mocap-transfer/src/RunRecord.hpp"

namespace mocap_transfer
{

/**
 * @brief Static calibration offset of one joint with its provenance
 *
 * The systematic pose correction is not part of this record; it is stored
 * only as a flag on the shoulders it applies to.
 *
 * @ticket 0017_session_recorder
 */
struct CalibrationOffsetRecord : public cpp_sqlite::BaseTransferObject
{
  std::string joint_name;
  QuaternionDRecord offset;
  QuaternionDRecord reference;
  uint32_t samples{0};

  uint32_t window_start_frame{0};
  uint32_t window_end_frame{0};  // exclusive
  double window_start_time{0.0};
  double window_end_time{0.0};
  std::string window_method;
  uint32_t is_fallback{0};

  double median_residual_deg{std::numeric_limits<double>::quiet_NaN()};
  uint32_t validation_passed{0};
  uint32_t pose_correction_detected{0};

  cpp_sqlite::ForeignKey<RunRecord> run;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(CalibrationOffsetRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (joint_name,
                       offset,
                       reference,
                       samples,
                       window_start_frame,
                       window_end_frame,
                       window_start_time,
                       window_end_time,
                       window_method,
                       is_fallback,
                       median_residual_deg,
                       validation_passed,
                       pose_correction_detected,
                       run));

}  // namespace mocap_transfer

#endif  // MOCAP_TRANSFER_CALIBRATION_OFFSET_RECORD_HPP
