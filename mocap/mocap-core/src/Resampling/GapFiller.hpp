// Ticket: 0007_gap_filling

#ifndef MOCAP_CORE_GAP_FILLER_HPP
#define MOCAP_CORE_GAP_FILLER_HPP

#include <cstddef>

#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/Resampling/InterpolationLog.hpp"

namespace mocap_core
{

/**
 * @brief Bounded gap filling ahead of resampling
 *
 * A run of missing samples is closed only when both of its neighbours are
 * valid and the time between those neighbours does not exceed the ceiling.
 * Runs touching the start or end of the recording are never filled.
 *
 * Positions are bridged with a monotone cubic over the joint's valid samples
 * (linear when fewer than four valid samples exist, logged as a fallback).
 * Orientations are bridged with slerp between the two neighbours and the
 * whole series is renormalized afterwards.
 *
 * @ticket 0007_gap_filling
 */
class GapFiller
{
public:
  struct Config
  {
    double maxPositionGapSeconds{0.1};
    double maxOrientationGapSeconds{0.25};
    std::size_t minCubicSamples{4};
  };

  struct Result
  {
    MotionSession session;
    InterpolationLog log;
    std::size_t framesFilled{0};
    std::size_t gapsLeftOpen{0};
  };

  /**
   * @brief Fill eligible gaps in every joint track
   *
   * @param session Input session, not modified
   * @param config Gap ceilings
   * @return New session plus the interpolation audit trail
   */
  [[nodiscard]] static Result fill(const MotionSession& session,
                                   const Config& config);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_GAP_FILLER_HPP
