// Ticket: 0010_hampel_prefilter

#ifndef MOCAP_CORE_HAMPEL_FILTER_HPP
#define MOCAP_CORE_HAMPEL_FILTER_HPP

#include <cstddef>
#include <span>
#include <vector>

namespace mocap_core
{

/**
 * @brief Sliding-window median outlier replacement
 *
 * A sample is replaced by its window median when it deviates from it by more
 * than nSigma robust standard deviations (MAD / 0.6745). NaN samples inside a
 * window are ignored. Signals shorter than the window are returned unchanged.
 *
 * @ticket 0010_hampel_prefilter
 */
class HampelFilter
{
public:
  struct Config
  {
    std::size_t windowSize{5};
    double nSigma{3.0};
  };

  struct Result
  {
    std::vector<double> filtered;
    std::vector<bool> outlierMask;
    std::size_t outlierCount{0};
  };

  [[nodiscard]] static Result apply(std::span<const double> signal,
                                    const Config& config);

  [[nodiscard]] static Result apply(std::span<const double> signal);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_HAMPEL_FILTER_HPP
