// Ticket: 0014_quality_gates

#ifndef MOCAP_CORE_GATE_AGGREGATOR_HPP
#define MOCAP_CORE_GATE_AGGREGATOR_HPP

#include <vector>

#include "mocap-core/src/Gates/GateVerdict.hpp"

namespace mocap_core
{

/**
 * @brief Worst-status-wins combination of gate verdicts
 *
 * REJECT > REVIEW > ACCEPT_HIGH_INTENSITY > PASS. Every non-passing gate
 * contributes its reason.
 *
 * @ticket 0014_quality_gates
 */
class GateAggregator
{
public:
  /**
   * @throws std::logic_error if a REVIEW or REJECT verdict has no reason
   */
  [[nodiscard]] static OverallVerdict aggregate(std::vector<GateVerdict> gates);
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_GATE_AGGREGATOR_HPP
