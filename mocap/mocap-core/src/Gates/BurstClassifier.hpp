// Ticket: 0015_burst_classification

#ifndef MOCAP_CORE_BURST_CLASSIFIER_HPP
#define MOCAP_CORE_BURST_CLASSIFIER_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mocap-core/src/Gates/GateVerdict.hpp"
#include "mocap-core/src/Kinematics/KinematicsEngine.hpp"

namespace mocap_core
{

/**
 * @brief Per-frame status code, also the tier of an event
 */
enum class BurstTier : int
{
  Normal = 0,
  Artifact = 1,  // too short to be movement, excluded
  Burst = 2,     // plausible but needs a visual audit
  Flow = 3       // sustained high-intensity movement
};

[[nodiscard]] std::string toString(BurstTier tier);

/**
 * @brief One run of consecutive frames above the velocity trigger
 */
struct BurstEvent
{
  std::size_t id{0};  // 1-based
  std::string jointName;
  std::size_t joint{0};
  std::size_t startFrame{0};
  std::size_t endFrame{0};  // exclusive
  std::size_t durationFrames{0};
  double durationMs{0.0};
  double maxVelocityDeg{0.0};   // [deg/s]
  double meanVelocityDeg{0.0};  // [deg/s]
  BurstTier tier{BurstTier::Normal};
  GateStatus status{GateStatus::Pass};
  std::string action;  // EXCLUDE, INCLUDE_FLAGGED or INCLUDE
};

enum class DensityLevel
{
  Acceptable,
  High,      // review
  Excessive  // reject
};

[[nodiscard]] std::string toString(DensityLevel level);

struct EventDensity
{
  DensityLevel level{DensityLevel::Acceptable};
  std::string reason;
  std::size_t artifactFrames{0};
  double artifactRatePercent{0.0};
  std::size_t burstEvents{0};
  double burstsPerMinute{0.0};
  std::size_t totalEvents{0};
  double durationMinutes{0.0};
};

struct VelocityStatistics
{
  double max{0.0};
  double mean{0.0};
  double stddev{0.0};
  double p95{0.0};
  double p99{0.0};
  std::size_t samples{0};
};

/**
 * @brief |omega| statistics with and without artifact frames
 */
struct CleanStatistics
{
  VelocityStatistics raw;
  VelocityStatistics clean;
  std::size_t excludedFrames{0};
  double dataRetainedPercent{100.0};
  std::map<std::string, VelocityStatistics> perJointClean;
};

struct BurstClassification
{
  Eigen::MatrixXi statusMask;  // frames x joints, BurstTier codes
  std::vector<BurstEvent> events;
  std::size_t artifactCount{0};
  std::size_t burstCount{0};
  std::size_t flowCount{0};
  EventDensity density;
  std::vector<std::size_t> framesToExclude;  // artifact frames, sorted
  std::vector<std::size_t> framesToReview;   // burst and extreme flow frames
  CleanStatistics statistics;
  GateVerdict verdict;
};

/**
 * @brief Gate 5: duration-tiered classification of high angular velocity
 *
 * Runs of frames with |omega| above the trigger are classified by length:
 * up to artifactMaxFrames is an artifact, up to burstMaxFrames a burst,
 * anything longer a flow (flagged when its mean exceeds the extreme
 * velocity). Event density over the whole recording can escalate the gate.
 *
 * Decision order: no events, density excessive, artifacts, bursts, extreme
 * flows, density high, otherwise accept as high intensity.
 *
 * @ticket 0015_burst_classification
 */
class BurstClassifier
{
public:
  struct Config
  {
    double velocityTrigger{2000.0};  // [deg/s]
    double velocityExtreme{5000.0};  // [deg/s]
    std::size_t artifactMaxFrames{3};
    std::size_t burstMaxFrames{7};

    double artifactRateWarnPercent{0.1};
    double artifactRateRejectPercent{1.0};
    double burstsPerMinuteWarn{5.0};
    double burstsPerMinuteReject{15.0};
    std::size_t totalEventsWarn{20};
    std::size_t totalEventsReject{50};
  };

  /**
   * @brief Classify events in an |omega| matrix
   *
   * @param magnitudeDeg Frames x joints angular speed [deg/s]
   * @param jointNames One name per column
   * @param fs Sampling rate [Hz]
   * @throws std::invalid_argument on a name/column mismatch or fs <= 0
   */
  [[nodiscard]] static BurstClassification classify(
    const Eigen::MatrixXd& magnitudeDeg,
    const std::vector<std::string>& jointNames,
    double fs,
    const Config& config);

  [[nodiscard]] static BurstClassification classify(
    const Eigen::MatrixXd& magnitudeDeg,
    const std::vector<std::string>& jointNames,
    double fs);

  // Classify the angular velocity of derived kinematics
  [[nodiscard]] static BurstClassification classify(const KinematicsResult& kinematics,
                                                    const Config& config);

  // Frames x joints |omega| [deg/s]
  [[nodiscard]] static Eigen::MatrixXd angularSpeed(const KinematicsResult& kinematics);

  [[nodiscard]] static BurstTier tierFor(std::size_t durationFrames,
                                         const Config& config);

  /**
   * @brief Raw and artifact-excluded |omega| statistics
   *
   * Excluded frames are dropped for every joint.
   */
  [[nodiscard]] static CleanStatistics cleanStatistics(
    const Eigen::MatrixXd& magnitudeDeg,
    const std::vector<std::string>& jointNames,
    const std::vector<std::size_t>& framesToExclude);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_BURST_CLASSIFIER_HPP
