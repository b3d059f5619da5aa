// Ticket: 0016_conditioning_pipeline

#ifndef MOCAP_CORE_CONDITIONING_PIPELINE_HPP
#define MOCAP_CORE_CONDITIONING_PIPELINE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "mocap-core/src/Calibration/CalibrationEngine.hpp"
#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/Filtering/PositionFilter.hpp"
#include "mocap-core/src/Filtering/SnrAnalysis.hpp"
#include "mocap-core/src/Gates/BoneLengthQc.hpp"
#include "mocap-core/src/Gates/BurstClassifier.hpp"
#include "mocap-core/src/Gates/GateVerdict.hpp"
#include "mocap-core/src/Gates/QualityGates.hpp"
#include "mocap-core/src/Kinematics/KinematicsEngine.hpp"
#include "mocap-core/src/Kinematics/SurgicalRepair.hpp"
#include "mocap-core/src/Resampling/GapFiller.hpp"
#include "mocap-core/src/Resampling/InterpolationLog.hpp"
#include "mocap-core/src/Resampling/TemporalResampler.hpp"

namespace mocap_core
{

/**
 * @brief Settings of every stage, passed explicitly to run()
 */
struct PipelineConfig
{
  GapFiller::Config gaps{};
  TemporalResampler::Config resampler{};
  PositionFilter::Config filter{};
  SnrAnalysis::Config snr{};
  CalibrationEngine::Config calibration{};
  bool applyPoseCorrection{false};
  KinematicsEngine::Config kinematics{};
  bool surgicalRepair{true};
  SurgicalRepair::Config repair{};
  QualityGates::Config gates{};
  BoneLengthQc::Config bones{};
  BurstClassifier::Config bursts{};
};

/**
 * @brief Everything a run produced, in stage order
 */
struct PipelineResult
{
  std::string runId;
  MotionSession conditioned;  // resampled, drift-corrected, filtered
  double samplingRate{0.0};   // [Hz]

  InterpolationLog interpolation;  // gap filling and resampling
  double sourceJitterMs{0.0};
  double maxNormErrorBefore{0.0};  // source and resampled stream, before correction
  double maxNormErrorAfter{0.0};
  std::size_t driftFramesCorrected{0};

  FilterDecision filter;
  SnrAnalysis::Report snr;

  CalibrationResult calibration;
  bool calibrationDegraded{false};
  std::string calibrationReason;

  KinematicsResult kinematics;  // after surgical repair when enabled
  std::vector<JointRepair> repairs;

  BoneLengthQc::Report bones;

  BurstClassification bursts;
  OverallVerdict verdict;
};

/**
 * @brief Runs one session through every stage
 *
 * Gap filling, resampling, drift correction, position filtering,
 * calibration, optional pose correction, kinematics, surgical repair and
 * gates 1 to 5. Gate 5 classifies the kinematics before repair so that
 * transient events are reported even when repair removes them from the
 * delivered signals. Stages throw on structural violations; soft failures
 * reach the gates as Degraded results or failure flags. A degraded
 * calibration is reported by Gate 1.
 *
 * @ticket 0016_conditioning_pipeline
 */
class ConditioningPipeline
{
public:
  [[nodiscard]] static PipelineResult run(const MotionSession& session,
                                          const PipelineConfig& config);

  [[nodiscard]] static PipelineResult run(const MotionSession& session);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_CONDITIONING_PIPELINE_HPP
