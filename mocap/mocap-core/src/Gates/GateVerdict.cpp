// Ticket: 0014_quality_gates

#include "mocap-core/src/Gates/GateVerdict.hpp"

#include <stdexcept>

namespace mocap_core
{

std::string toString(GateStatus status)
{
  switch (status)
  {
    case GateStatus::Pass:
      return "PASS";
    case GateStatus::AcceptHighIntensity:
      return "ACCEPT_HIGH_INTENSITY";
    case GateStatus::Review:
      return "REVIEW";
    case GateStatus::Reject:
      return "REJECT";
  }
  return "UNKNOWN";
}

GateStatus gateStatusFromString(const std::string& text)
{
  if (text == "PASS")
  {
    return GateStatus::Pass;
  }
  if (text == "ACCEPT_HIGH_INTENSITY")
  {
    return GateStatus::AcceptHighIntensity;
  }
  if (text == "REVIEW")
  {
    return GateStatus::Review;
  }
  if (text == "REJECT")
  {
    return GateStatus::Reject;
  }
  throw std::invalid_argument{"GateStatus: unknown status '" + text + "'"};
}

GateStatus worst(GateStatus a, GateStatus b)
{
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

}  // namespace mocap_core
