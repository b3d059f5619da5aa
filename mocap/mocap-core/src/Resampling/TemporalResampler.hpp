// Ticket: 0006_temporal_resampler

#ifndef MOCAP_CORE_TEMPORAL_RESAMPLER_HPP
#define MOCAP_CORE_TEMPORAL_RESAMPLER_HPP

#include <cstddef>
#include <vector>

#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/Resampling/ArtifactDetector.hpp"
#include "mocap-core/src/Resampling/InterpolationLog.hpp"

namespace mocap_core
{

enum class PositionInterpolation
{
  Linear,
  MonotoneCubic
};

/**
 * @brief Resamples a session onto a uniform time grid
 *
 * The grid is index based (t_i = t_start + i / fs) so its delta variance is
 * zero up to rounding regardless of duration and rate. Before interpolating,
 * position samples with implausible velocity are masked to NaN per joint.
 *
 * Positions use a monotone cubic when at least four valid samples exist,
 * linear with two or three (logged as a fallback) and stay NaN otherwise.
 * Values are never extrapolated beyond the span of valid samples.
 *
 * Orientations must be complete on input (see GapFiller). Keyframes are
 * normalized and made continuous, slerped, then anchored to w >= 0.
 *
 * @ticket 0006_temporal_resampler
 */
class TemporalResampler
{
public:
  struct Config
  {
    double targetRate{120.0};  // [Hz]
    PositionInterpolation positionMethod{PositionInterpolation::MonotoneCubic};
    bool maskVelocityArtifacts{true};
    ArtifactDetector::Config artifacts{};
  };

  struct Result
  {
    MotionSession session;
    std::vector<std::size_t> artifactFramesPerJoint;
    double sourceRate{0.0};       // [Hz], 1 / median(dt) of the input
    double sourceJitterMs{0.0};   // std(dt) of the input [ms]
    double gridDeltaStd{0.0};     // std(dt) of the output grid [s]
    InterpolationLog log;
  };

  /**
   * @brief Resample every joint track onto the target grid
   *
   * @param session Input session (at least two frames)
   * @param config Target rate, interpolation and artifact settings
   * @return Resampled session and diagnostics
   * @throws std::invalid_argument with fewer than two frames or a bad rate
   * @throws std::runtime_error if an orientation channel contains NaN
   */
  [[nodiscard]] static Result resample(const MotionSession& session,
                                       const Config& config);

  [[nodiscard]] static Result resample(const MotionSession& session);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_TEMPORAL_RESAMPLER_HPP
