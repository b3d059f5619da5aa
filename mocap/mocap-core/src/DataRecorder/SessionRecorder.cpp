// Ticket: 0017_session_recorder

#include "mocap-core/src/DataRecorder/SessionRecorder.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "mocap-core/src/DataRecorder/RecordConversions.hpp"
#include "mocap-transfer/src/Records.hpp"
#include "mocap-utils/src/PathUtils.hpp"

namespace mocap_core
{

namespace
{

constexpr char kLoggerName[] = "mocap_recorder";

std::shared_ptr<spdlog::logger> recorderLogger()
{
  if (auto existing = spdlog::get(kLoggerName))
  {
    return existing;
  }
  return spdlog::stdout_color_mt(kLoggerName);
}

}  // namespace

SessionRecorder::SessionRecorder(const std::string& runId, const Config& config)
  : runId_{runId},
    config_{config},
    databasePath_{
      mocap_utils::runArtifactPath(config.outputDir, runId, config.databaseName)},
    logger_{recorderLogger()}
{
  std::error_code ec;
  std::filesystem::create_directories(databasePath_.parent_path(), ec);
  if (ec)
  {
    throw std::runtime_error{"SessionRecorder: cannot create " +
                             databasePath_.parent_path().string() + ": " +
                             ec.message()};
  }

  database_ = std::make_unique<cpp_sqlite::Database>(databasePath_.string(), true);

  // Run record first for FK integrity
  database_->getDAO<mocap_transfer::RunRecord>();

  // Nested sub-records
  database_->getDAO<mocap_transfer::QuaternionDRecord>();
  database_->getDAO<mocap_transfer::Vector3DRecord>();

  database_->getDAO<mocap_transfer::CalibrationOffsetRecord>();
  database_->getDAO<mocap_transfer::FilterDecisionRecord>();
  database_->getDAO<mocap_transfer::ResidualPointRecord>();
  database_->getDAO<mocap_transfer::GateVerdictRecord>();
  database_->getDAO<mocap_transfer::BurstEventRecord>();
  database_->getDAO<mocap_transfer::KinematicFrameRecord>();

  logger_->info("Opened {} for run {}", databasePath_.string(), runId_);
}

void SessionRecorder::recordRun(const PipelineResult& result)
{
  mocap_transfer::RunRecord record{};
  record.id = kRunRecordId;
  record.run_id = runId_;
  record.sampling_rate = result.samplingRate;
  record.frame_count = static_cast<uint32_t>(result.conditioned.frameCount());
  record.joint_count = static_cast<uint32_t>(result.conditioned.jointCount());
  record.duration_s = result.conditioned.duration();
  record.source_jitter_ms = result.sourceJitterMs;
  record.max_norm_error = result.maxNormErrorAfter;
  record.overall_status = toString(result.verdict.status);
  getDAO<mocap_transfer::RunRecord>().addToBuffer(record);
}

void SessionRecorder::recordCalibration(const CalibrationResult& calibration)
{
  auto& dao = getDAO<mocap_transfer::CalibrationOffsetRecord>();
  for (const auto& offset : calibration.offsets)
  {
    auto record = toRecord(offset, calibration);
    record.run.id = kRunRecordId;
    dao.addToBuffer(record);
  }
  logger_->debug("Buffered {} calibration offset(s)", calibration.offsets.size());
}

void SessionRecorder::recordFilterDecision(const FilterDecision& decision)
{
  uint32_t const decisionId = nextDecisionId_++;

  auto record = toRecord(decision);
  record.id = decisionId;
  record.run.id = kRunRecordId;
  getDAO<mocap_transfer::FilterDecisionRecord>().addToBuffer(record);

  auto& pointDAO = getDAO<mocap_transfer::ResidualPointRecord>();
  std::size_t const points =
    std::min(decision.testFrequencies.size(), decision.residualRms.size());
  for (std::size_t i = 0; i < points; ++i)
  {
    mocap_transfer::ResidualPointRecord point{};
    point.frequency_hz = decision.testFrequencies[i];
    point.residual_rms = decision.residualRms[i];
    point.decision.id = decisionId;
    pointDAO.addToBuffer(point);
  }
  logger_->debug("Buffered filter decision {} with {} residual point(s)",
                 decisionId,
                 points);
}

void SessionRecorder::recordGates(const OverallVerdict& verdict,
                                  const BurstClassification& bursts)
{
  auto& gateDAO = getDAO<mocap_transfer::GateVerdictRecord>();
  for (const auto& gate : verdict.gates)
  {
    auto record = toRecord(gate);
    record.run.id = kRunRecordId;
    gateDAO.addToBuffer(record);
  }

  auto& eventDAO = getDAO<mocap_transfer::BurstEventRecord>();
  for (const auto& event : bursts.events)
  {
    auto record = toRecord(event);
    record.run.id = kRunRecordId;
    eventDAO.addToBuffer(record);
  }
}

void SessionRecorder::recordKinematics(const KinematicsResult& kinematics,
                                       const Eigen::MatrixXi& statusMask)
{
  auto& dao = getDAO<mocap_transfer::KinematicFrameRecord>();
  std::size_t const frames = kinematics.times.size();
  for (std::size_t j = 0; j < kinematics.joints.size(); ++j)
  {
    const auto& joint = kinematics.joints[j];
    for (std::size_t i = 0; i < frames; ++i)
    {
      auto const row = static_cast<Eigen::Index>(i);
      mocap_transfer::KinematicFrameRecord record{};
      record.frame_index = static_cast<uint32_t>(i);
      record.time = kinematics.times[i];
      record.joint_name = joint.jointName;
      record.zeroed_orientation = toRecord(joint.zeroedOrientation[i]);
      record.rotation_vector = toRecord(Eigen::Vector3d{joint.rotationVectorDeg.row(row).transpose()});
      record.angular_velocity = toRecord(Eigen::Vector3d{joint.angularVelocityDeg.row(row).transpose()});
      record.angular_acceleration =
        toRecord(Eigen::Vector3d{joint.angularAccelerationDeg.row(row).transpose()});
      record.linear_velocity = toRecord(Eigen::Vector3d{joint.linearVelocity.row(row).transpose()});
      record.linear_acceleration =
        toRecord(Eigen::Vector3d{joint.linearAcceleration.row(row).transpose()});
      record.root_relative_position =
        toRecord(Eigen::Vector3d{joint.rootRelativePosition.row(row).transpose()});
      if (row < statusMask.rows() && static_cast<Eigen::Index>(j) < statusMask.cols())
      {
        record.status_code =
          static_cast<uint32_t>(statusMask(row, static_cast<Eigen::Index>(j)));
      }
      record.run.id = kRunRecordId;
      dao.addToBuffer(record);
    }
  }
  logger_->debug("Buffered {} kinematic row(s)", frames * kinematics.joints.size());
}

void SessionRecorder::recordAll(const PipelineResult& result)
{
  recordRun(result);
  recordCalibration(result.calibration);
  recordFilterDecision(result.filter);
  recordGates(result.verdict, result.bursts);
  if (config_.recordKinematics)
  {
    recordKinematics(result.kinematics, result.bursts.statusMask);
  }
  flush();
}

void SessionRecorder::flush()
{
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
  logger_->info("Flushed run {} to {}", runId_, databasePath_.string());
}

const cpp_sqlite::Database& SessionRecorder::getDatabase() const
{
  return *database_;
}

}  // namespace mocap_core
