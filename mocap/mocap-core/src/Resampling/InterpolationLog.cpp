// Ticket: 0007_gap_filling

#include "mocap-core/src/Resampling/InterpolationLog.hpp"

#include <algorithm>
#include <iterator>

namespace mocap_core
{

std::string toString(InterpolationMethod method)
{
  switch (method)
  {
    case InterpolationMethod::Linear:
      return "linear";
    case InterpolationMethod::MonotoneCubic:
      return "monotone_cubic";
    case InterpolationMethod::Slerp:
      return "slerp";
    case InterpolationMethod::None:
      return "none";
  }
  return "unknown";
}

void InterpolationLog::record(Event event)
{
  auto& summary = perJoint_[event.joint];
  ++summary.totalGaps;
  if (event.methodUsed != InterpolationMethod::None)
  {
    summary.framesInterpolated += event.gapFrames;
    summary.maxGapFrames = std::max(summary.maxGapFrames, event.gapFrames);
  }
  summary.methodsUsed.insert(event.methodUsed);
  if (event.isFallback())
  {
    ++summary.fallbackCount;
  }
  events_.push_back(std::move(event));
}

void InterpolationLog::merge(const InterpolationLog& other)
{
  auto const incoming = other.events_;
  for (const auto& event : incoming)
  {
    record(event);
  }
}

std::vector<InterpolationLog::Event> InterpolationLog::fallbackEvents() const
{
  std::vector<Event> out;
  std::copy_if(events_.begin(),
               events_.end(),
               std::back_inserter(out),
               [](const Event& e) { return e.isFallback(); });
  return out;
}

InterpolationLog::Summary InterpolationLog::summarize() const
{
  Summary summary;
  summary.totalEvents = events_.size();
  if (events_.empty())
  {
    summary.overallStatus = "PRISTINE";
    return summary;
  }

  for (const auto& [joint, js] : perJoint_)
  {
    summary.totalFallbacks += js.fallbackCount;
    summary.maxGapFrames = std::max(summary.maxGapFrames, js.maxGapFrames);
    if (js.fallbackCount > 0)
    {
      summary.jointsWithFallbacks.push_back(joint);
    }
  }
  summary.fallbackRate = static_cast<double>(summary.totalFallbacks) /
                         static_cast<double>(summary.totalEvents);

  if (summary.totalFallbacks == 0)
  {
    summary.overallStatus = "GOLD";
  }
  else if (summary.totalFallbacks < 5)
  {
    summary.overallStatus = "ACCEPTABLE";
  }
  else if (summary.jointsWithFallbacks.size() < 3)
  {
    summary.overallStatus = "REVIEW";
  }
  else
  {
    summary.overallStatus = "CAUTION";
  }
  return summary;
}

}  // namespace mocap_core
