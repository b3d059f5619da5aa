// Ticket: 0014_quality_gates

#include "mocap-core/src/Gates/GateAggregator.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace mocap_core
{

OverallVerdict GateAggregator::aggregate(std::vector<GateVerdict> gates)
{
  OverallVerdict overall;
  for (const auto& gate : gates)
  {
    bool const severe =
      gate.status == GateStatus::Review || gate.status == GateStatus::Reject;
    if (severe && gate.reason.empty())
    {
      throw std::logic_error{"GateAggregator: gate " + std::to_string(gate.gate) +
                             " is " + toString(gate.status) + " without a reason"};
    }
    overall.status = worst(overall.status, gate.status);
    if (!gate.reason.empty())
    {
      overall.reasons.push_back("Gate " + std::to_string(gate.gate) + ": " +
                                gate.reason);
    }
  }
  overall.gates = std::move(gates);

  if (overall.status == GateStatus::Review || overall.status == GateStatus::Reject)
  {
    spdlog::warn("Overall verdict {} ({} reason(s))",
                 toString(overall.status),
                 overall.reasons.size());
  }
  else
  {
    spdlog::info("Overall verdict {}", toString(overall.status));
  }
  return overall;
}

}  // namespace mocap_core
