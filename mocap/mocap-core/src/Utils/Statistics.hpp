// Ticket: 0004_robust_statistics

#ifndef MOCAP_CORE_STATISTICS_HPP
#define MOCAP_CORE_STATISTICS_HPP

#include <span>
#include <vector>

namespace mocap_core::stats
{

/**
 * @brief Small set of robust/descriptive statistics over finite samples
 *
 * Inputs are expected to be finite (see finiteOnly()). Empty input
 * returns NaN. Standard deviation is the population form (divides by N).
 */

[[nodiscard]] double mean(std::span<const double> values);

[[nodiscard]] double stddev(std::span<const double> values);

[[nodiscard]] double median(std::span<const double> values);

// Median absolute deviation from the median (unscaled)
[[nodiscard]] double mad(std::span<const double> values);

// Linear-interpolated percentile, p in [0, 100]
[[nodiscard]] double percentile(std::span<const double> values, double p);

[[nodiscard]] double rms(std::span<const double> values);

// Successive differences x[i+1] - x[i] (size N-1)
[[nodiscard]] std::vector<double> diff(std::span<const double> values);

// Copy with NaN/Inf entries removed
[[nodiscard]] std::vector<double> finiteOnly(std::span<const double> values);

// Least-squares slope of y against x
[[nodiscard]] double linearSlope(std::span<const double> x,
                                 std::span<const double> y);

}  // namespace mocap_core::stats

#endif  // MOCAP_CORE_STATISTICS_HPP
