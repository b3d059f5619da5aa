// Ticket: 0009_adaptive_cutoff

#ifndef MOCAP_CORE_BODY_REGION_HPP
#define MOCAP_CORE_BODY_REGION_HPP

#include <string>

namespace mocap_core
{

enum class BodyRegion
{
  Trunk,
  Head,
  UpperProximal,
  UpperDistal,
  LowerProximal,
  LowerDistal
};

/**
 * @brief Literature cutoffs for one body region [Hz]
 */
struct RegionProfile
{
  double fixedCutoff{10.0};
  double rangeMin{8.0};
  double rangeMax{14.0};
};

[[nodiscard]] std::string toString(BodyRegion region);

[[nodiscard]] RegionProfile profileOf(BodyRegion region);

/**
 * @brief Classify a joint by case-insensitive name pattern
 *
 * Regions are tested in declaration order and the first match wins, so
 * "ForeArm" resolves through the "arm" pattern of the upper proximal region.
 * Names matching no pattern fall back to the upper distal region.
 */
[[nodiscard]] BodyRegion classifyJoint(const std::string& jointName);

// Trunk markers used for the guardrail of the global strategy
[[nodiscard]] bool isTrunkJoint(const std::string& jointName);

// Lower-cased copy
[[nodiscard]] std::string toLower(std::string text);

}  // namespace mocap_core

#endif  // MOCAP_CORE_BODY_REGION_HPP
