// Ticket: 0016_conditioning_pipeline

#include "mocap-core/src/Pipeline/ConditioningPipeline.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Gates/GateAggregator.hpp"
#include "mocap-core/src/Quaternion/DriftMonitor.hpp"

namespace mocap_core
{

namespace
{

struct DriftOutcome
{
  MotionSession session;
  double maxBefore{0.0};
  double maxAfter{0.0};
  std::size_t framesCorrected{0};
};

DriftOutcome correctDrift(const MotionSession& session)
{
  std::vector<JointTrack> tracks = session.tracks();
  double maxBefore = 0.0;
  double maxAfter = 0.0;
  std::size_t framesCorrected = 0;
  for (JointIndex j = 0; j < tracks.size(); ++j)
  {
    auto correction = DriftMonitor::correct(tracks[j].orientations, session.times());
    maxBefore = std::max(maxBefore, correction.before.drift.maxNormError);
    maxAfter = std::max(maxAfter, correction.residualErrorAfter);
    framesCorrected += correction.framesCorrected;
    if (!correction.successful())
    {
      spdlog::warn("ConditioningPipeline: {} orientation integrity {} after "
                   "correction ({})",
                   session.skeleton().name(j),
                   toString(correction.after.status),
                   correction.after.reason);
    }
    tracks[j].orientations = std::move(correction.corrected);
  }
  return DriftOutcome{session.withTracks(session.times(), std::move(tracks)),
                      maxBefore,
                      maxAfter,
                      framesCorrected};
}

// Worst | |q| - 1 | of the orientations as delivered, before resampling
double sourceNormError(const MotionSession& session)
{
  double worstError = 0.0;
  for (JointIndex j = 0; j < session.jointCount(); ++j)
  {
    worstError = std::max(
      worstError, DriftMonitor::analyze(session.track(j).orientations).maxNormError);
  }
  return worstError;
}

}  // namespace

PipelineResult ConditioningPipeline::run(const MotionSession& session,
                                         const PipelineConfig& config)
{
  spdlog::info("ConditioningPipeline: run {} ({} joint(s), {} frame(s))",
               session.runId(),
               session.jointCount(),
               session.frameCount());

  auto filled = GapFiller::fill(session, config.gaps);
  auto resampled = TemporalResampler::resample(filled.session, config.resampler);
  double const fs = config.resampler.targetRate;

  InterpolationLog interpolation = std::move(filled.log);
  interpolation.merge(resampled.log);

  auto drift = correctDrift(resampled.session);
  double const normErrorBefore = std::max(sourceNormError(session), drift.maxBefore);
  if (normErrorBefore > 0.01)
  {
    spdlog::warn("ConditioningPipeline: normalization drift {:.2e} required "
                 "correction",
                 normErrorBefore);
  }

  auto filtered = PositionFilter::apply(drift.session, fs, config.filter);
  auto snr = SnrAnalysis::perJoint(drift.session, filtered.session, config.snr);
  auto bones = BoneLengthQc::analyze(filtered.session, config.bones);

  auto calibration = CalibrationEngine::calibrate(filtered.session, config.calibration);
  if (!calibration.hasValue())
  {
    throw std::runtime_error{"ConditioningPipeline: calibration failed: " +
                             calibration.reason()};
  }
  if (calibration.isDegraded())
  {
    spdlog::warn("ConditioningPipeline: calibration degraded, reported on "
                 "Gate 1: {}",
                 calibration.reason());
  }

  MotionSession conditioned = filtered.session;
  if (config.applyPoseCorrection)
  {
    conditioned =
      CalibrationEngine::applyPoseCorrection(conditioned, calibration.value());
  }

  auto kinematics = KinematicsEngine::compute(
    conditioned, calibration.value().window, fs, config.kinematics);

  auto bursts = BurstClassifier::classify(kinematics, config.bursts);

  std::vector<JointRepair> repairs;
  if (config.surgicalRepair)
  {
    auto repaired = SurgicalRepair::repair(kinematics, config.repair);
    kinematics = std::move(repaired.kinematics);
    repairs = std::move(repaired.repairs);
  }

  std::vector<GateVerdict> gates;
  gates.push_back(QualityGates::calibrationIntegrity(calibration));
  gates.push_back(QualityGates::temporalIntegrity(
    session.times(), interpolation, conditioned.frameCount(), config.gates));
  gates.push_back(QualityGates::filteringAdequacy(filtered.decision, snr));
  gates.push_back(QualityGates::mathematicalCompliance(conditioned.skeleton().names(),
                                                       normErrorBefore,
                                                       drift.maxAfter,
                                                       bones,
                                                       config.gates));
  gates.push_back(bursts.verdict);
  auto verdict = GateAggregator::aggregate(std::move(gates));

  PipelineResult result{session.runId(),
                        std::move(conditioned),
                        fs,
                        std::move(interpolation),
                        resampled.sourceJitterMs,
                        normErrorBefore,
                        drift.maxAfter,
                        drift.framesCorrected,
                        std::move(filtered.decision),
                        std::move(snr),
                        calibration.value(),
                        calibration.isDegraded(),
                        calibration.reason(),
                        std::move(kinematics),
                        std::move(repairs),
                        std::move(bones),
                        std::move(bursts),
                        std::move(verdict)};

  spdlog::info("ConditioningPipeline: run {} finished with {}",
               result.runId,
               toString(result.verdict.status));
  return result;
}

PipelineResult ConditioningPipeline::run(const MotionSession& session)
{
  return run(session, PipelineConfig{});
}

}  // namespace mocap_core
