// Ticket: 0006_temporal_resampler

#ifndef MOCAP_CORE_TIME_GRID_HPP
#define MOCAP_CORE_TIME_GRID_HPP

#include <span>
#include <vector>

namespace mocap_core
{

/**
 * @brief Uniform time grid construction and sampling-rate diagnostics
 *
 * Grid samples are computed as t_start + i / fs, never by accumulating a
 * step, so the spacing carries no floating-point drift whatever the duration.
 *
 * @ticket 0006_temporal_resampler
 */
class TimeGrid
{
public:
  /**
   * @brief Build a uniform grid inside [tStart, tEnd]
   *
   * The grid starts exactly at tStart and its last sample never exceeds tEnd
   * (no extrapolation), also when (tEnd - tStart) * fs is not an integer.
   *
   * @param tStart First timestamp [s]
   * @param tEnd Last timestamp [s]
   * @param fs Target sampling rate [Hz]
   * @throws std::invalid_argument if fs <= 0 or tEnd < tStart
   */
  [[nodiscard]] static std::vector<double> build(double tStart,
                                                 double tEnd,
                                                 double fs);

  /**
   * @brief Sampling rate estimate 1 / median(dt) [Hz]
   * @throws std::invalid_argument with fewer than two timestamps
   */
  [[nodiscard]] static double estimateSamplingRate(std::span<const double> times);

  // Standard deviation of successive deltas [s]
  [[nodiscard]] static double deltaStd(std::span<const double> times);

  // Largest successive delta [s]
  [[nodiscard]] static double maxDelta(std::span<const double> times);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_TIME_GRID_HPP
