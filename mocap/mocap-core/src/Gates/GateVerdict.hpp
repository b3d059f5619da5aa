// Ticket: 0014_quality_gates

#ifndef MOCAP_CORE_GATE_VERDICT_HPP
#define MOCAP_CORE_GATE_VERDICT_HPP

#include <map>
#include <string>
#include <vector>

namespace mocap_core
{

/**
 * @brief Gate outcome, declared in increasing severity
 */
enum class GateStatus
{
  Pass,
  AcceptHighIntensity,
  Review,
  Reject
};

[[nodiscard]] std::string toString(GateStatus status);

// Parses "PASS", "ACCEPT_HIGH_INTENSITY", "REVIEW", "REJECT"
[[nodiscard]] GateStatus gateStatusFromString(const std::string& text);

// More severe of the two
[[nodiscard]] GateStatus worst(GateStatus a, GateStatus b);

/**
 * @brief Verdict of one gate
 *
 * Every Review or Reject verdict carries a non-empty reason.
 */
struct GateVerdict
{
  int gate{0};
  std::string name;
  GateStatus status{GateStatus::Pass};
  std::string reason;
  std::map<std::string, double> metrics;
  std::vector<std::string> notes;  // informational findings, never affect status
};

/**
 * @brief Combined verdict over all gates
 */
struct OverallVerdict
{
  GateStatus status{GateStatus::Pass};
  std::vector<GateVerdict> gates;
  std::vector<std::string> reasons;  // one per non-passing gate, gate order
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_GATE_VERDICT_HPP
