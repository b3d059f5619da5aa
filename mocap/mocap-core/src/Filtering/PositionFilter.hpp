// Ticket: 0009_adaptive_cutoff

#ifndef MOCAP_CORE_POSITION_FILTER_HPP
#define MOCAP_CORE_POSITION_FILTER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "mocap-core/src/DataTypes/MotionSession.hpp"
#include "mocap-core/src/Filtering/BodyRegion.hpp"
#include "mocap-core/src/Filtering/HampelFilter.hpp"

namespace mocap_core
{

enum class FilterMode
{
  Global,     // median residual cutoff of the most dynamic channels
  PerRegion,  // fixed literature cutoff per body region
  Fixed       // one explicit cutoff
};

[[nodiscard]] std::string toString(FilterMode mode);

/**
 * @brief Cutoff applied to the channels of one body region
 */
struct RegionFilterDecision
{
  BodyRegion region{BodyRegion::UpperDistal};
  double cutoffHz{0.0};
  std::string representative;
  std::vector<std::string> joints;
  std::optional<double> suggestedHz;  // residual analysis suggestion
  std::string validationStatus;       // VALID or AGGRESSIVE
  std::string validationMethod;
};

/**
 * @brief Record of how the position low-pass cutoff was chosen
 */
struct FilterDecision
{
  FilterMode mode{FilterMode::Global};
  double cutoffHz{0.0};
  double fmin{1.0};   // search range [Hz]
  double fmax{16.0};
  std::string method;

  std::vector<std::string> representativeSignals;
  std::vector<double> individualCutoffs;

  // Residual curve of the most dynamic representative
  std::vector<double> testFrequencies;
  std::vector<double> residualRms;
  double residualRmsFinal{0.0};

  bool failed{false};
  std::string failureReason;

  std::vector<RegionFilterDecision> regions;
  std::vector<std::string> partialChannels;      // NaN kept, finite spans filtered
  std::vector<std::string> excludedChannels;     // no finite span to filter
  std::vector<std::string> passthroughChannels;  // cutoff too close to Nyquist
  std::size_t hampelOutliers{0};
};

/**
 * @brief Zero-phase low-pass filtering of joint positions
 *
 * Orientations are never touched. A channel containing NaN is filtered on
 * each run of at least ten finite samples and keeps its NaN samples in
 * place; a channel with no such run is excluded and passed through. Cutoff
 * selection uses the longest finite run of each channel. A channel whose
 * cutoff is at or above fs / 2 - 1 is passed through unfiltered. All three
 * cases are recorded in the decision.
 *
 * @ticket 0009_adaptive_cutoff
 */
class PositionFilter
{
public:
  struct Config
  {
    FilterMode mode{FilterMode::Global};
    double fixedCutoffHz{8.0};  // Fixed mode only [Hz]
    int fmin{1};
    int fmax{16};
    std::size_t representativeCount{5};
    double trunkMinCutoff{6.0};   // [Hz]
    double distalMinCutoff{8.0};  // [Hz]
    bool hampelPrefilter{false};
    HampelFilter::Config hampel{};
  };

  struct Result
  {
    MotionSession session;
    FilterDecision decision;
  };

  /**
   * @brief Select cutoffs and filter every position channel
   *
   * @param session Session on a uniform grid
   * @param fs Sampling rate of the grid [Hz]
   * @param config Mode and search settings
   * @throws std::invalid_argument if fs <= 0, the fixed cutoff is not
   *         positive, or no channel has a finite run to filter
   */
  [[nodiscard]] static Result apply(const MotionSession& session,
                                    double fs,
                                    const Config& config);

  // Dynamics score std(diff(x)) used to rank representative channels
  [[nodiscard]] static double dynamicsScore(const std::vector<double>& signal);

  // "<Joint>__px" style channel name, axis in [0, 2]
  [[nodiscard]] static std::string channelName(const std::string& joint,
                                               int axis);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_POSITION_FILTER_HPP
