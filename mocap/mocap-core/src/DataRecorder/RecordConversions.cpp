// Ticket: 0017_session_recorder

#include "mocap-core/src/DataRecorder/RecordConversions.hpp"

#include <algorithm>
#include <cstdint>

#include <spdlog/fmt/fmt.h>

namespace mocap_core
{

mocap_transfer::QuaternionDRecord toRecord(const QuaternionD& q)
{
  mocap_transfer::QuaternionDRecord record{};
  record.w = q.w();
  record.x = q.x();
  record.y = q.y();
  record.z = q.z();
  return record;
}

mocap_transfer::Vector3DRecord toRecord(const Eigen::Vector3d& v)
{
  mocap_transfer::Vector3DRecord record{};
  record.x = v.x();
  record.y = v.y();
  record.z = v.z();
  return record;
}

mocap_transfer::CalibrationOffsetRecord toRecord(const CalibrationOffset& offset,
                                                 const CalibrationResult& calibration)
{
  mocap_transfer::CalibrationOffsetRecord record{};
  record.joint_name = offset.jointName;
  record.offset = toRecord(offset.offset);
  record.reference = toRecord(offset.reference);
  record.samples = static_cast<uint32_t>(offset.samples);

  const auto& window = calibration.window;
  record.window_start_frame = static_cast<uint32_t>(window.startFrame);
  record.window_end_frame = static_cast<uint32_t>(window.endFrame);
  record.window_start_time = window.startTime;
  record.window_end_time = window.endTime;
  record.window_method = window.method;
  record.is_fallback = window.isFallback ? 1 : 0;

  const auto& joints = calibration.validation.joints;
  auto it = std::find_if(joints.begin(),
                         joints.end(),
                         [&offset](const JointResidual& r)
                         { return r.jointName == offset.jointName; });
  if (it != joints.end())
  {
    record.median_residual_deg = it->medianResidualDeg;
    record.validation_passed = it->passed ? 1 : 0;
  }

  const auto& shoulders = calibration.pose.shoulderJoints;
  bool const detected =
    calibration.pose.applied &&
    std::find(shoulders.begin(), shoulders.end(), offset.jointName) != shoulders.end();
  record.pose_correction_detected = detected ? 1 : 0;
  return record;
}

mocap_transfer::FilterDecisionRecord toRecord(const FilterDecision& decision)
{
  mocap_transfer::FilterDecisionRecord record{};
  record.mode = toString(decision.mode);
  record.cutoff_hz = decision.cutoffHz;
  record.search_min_hz = decision.fmin;
  record.search_max_hz = decision.fmax;
  record.method = decision.method;
  for (const auto& signal : decision.representativeSignals)
  {
    record.representative_signals +=
      record.representative_signals.empty() ? signal : "," + signal;
  }
  record.residual_rms_final = decision.residualRmsFinal;
  record.failed = decision.failed ? 1 : 0;
  record.failure_reason = decision.failureReason;
  record.passthrough_channels = static_cast<uint32_t>(decision.passthroughChannels.size());
  record.partial_channels = static_cast<uint32_t>(decision.partialChannels.size());
  record.excluded_channels = static_cast<uint32_t>(decision.excludedChannels.size());
  return record;
}

mocap_transfer::GateVerdictRecord toRecord(const GateVerdict& verdict)
{
  mocap_transfer::GateVerdictRecord record{};
  record.gate = static_cast<uint32_t>(verdict.gate);
  record.name = verdict.name;
  record.status = toString(verdict.status);
  record.reason = verdict.reason;
  record.metrics = flattenMetrics(verdict.metrics);
  return record;
}

mocap_transfer::BurstEventRecord toRecord(const BurstEvent& event)
{
  mocap_transfer::BurstEventRecord record{};
  record.joint_name = event.jointName;
  record.start_frame = static_cast<uint32_t>(event.startFrame);
  record.end_frame = static_cast<uint32_t>(event.endFrame);
  record.duration_frames = static_cast<uint32_t>(event.durationFrames);
  record.duration_ms = event.durationMs;
  record.max_velocity_deg_s = event.maxVelocityDeg;
  record.mean_velocity_deg_s = event.meanVelocityDeg;
  record.tier = toString(event.tier);
  record.status = toString(event.status);
  record.action = event.action;
  return record;
}

std::string flattenMetrics(const std::map<std::string, double>& metrics)
{
  std::string out;
  for (const auto& [key, value] : metrics)
  {
    if (!out.empty())
    {
      out += ';';
    }
    out += fmt::format("{}={:.6g}", key, value);
  }
  return out;
}

}  // namespace mocap_core
