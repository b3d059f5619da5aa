// Ticket: 0008_zero_phase_filter

#ifndef MOCAP_CORE_BUTTERWORTH_FILTER_HPP
#define MOCAP_CORE_BUTTERWORTH_FILTER_HPP

#include <array>
#include <span>
#include <vector>

namespace mocap_core
{

/**
 * @brief Second-order Butterworth low-pass with zero-phase application
 *
 * Coefficients come from the bilinear transform with frequency prewarping.
 * filtfilt() runs the filter forward and backward over an odd extension of
 * the signal (padlen = min(9, n - 1)) with steady-state initial conditions,
 * so a constant input passes through unchanged and there is no phase lag.
 *
 * @ticket 0008_zero_phase_filter
 */
class ButterworthFilter
{
public:
  struct Coefficients
  {
    std::array<double, 3> b{};
    std::array<double, 3> a{};  // a[0] == 1
  };

  /**
   * @brief Design the low-pass section
   *
   * @param cutoffHz Cutoff frequency [Hz]
   * @param fs Sampling rate [Hz]
   * @throws std::invalid_argument unless 0 < cutoffHz < fs / 2
   */
  [[nodiscard]] static Coefficients design(double cutoffHz, double fs);

  /**
   * @brief Steady-state initial conditions for a unit step input
   */
  [[nodiscard]] static std::array<double, 2> steadyState(
    const Coefficients& c);

  /**
   * @brief Single causal pass (direct form II transposed)
   *
   * @param zi Initial filter state, already scaled by the caller
   */
  [[nodiscard]] static std::vector<double> lfilter(const Coefficients& c,
                                                   std::span<const double> x,
                                                   std::array<double, 2> zi);

  /**
   * @brief Forward-backward zero-phase filtering
   *
   * Signals with fewer than two samples are returned unchanged.
   */
  [[nodiscard]] static std::vector<double> filtfilt(const Coefficients& c,
                                                    std::span<const double> x);

  // design() followed by filtfilt()
  [[nodiscard]] static std::vector<double> lowpass(std::span<const double> x,
                                                   double cutoffHz,
                                                   double fs);

  static constexpr std::size_t kMaxPadLength = 9;
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_BUTTERWORTH_FILTER_HPP
