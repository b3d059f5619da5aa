// Ticket: 0007_gap_filling

#ifndef MOCAP_CORE_INTERPOLATION_LOG_HPP
#define MOCAP_CORE_INTERPOLATION_LOG_HPP

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace mocap_core
{

enum class InterpolationMethod
{
  Linear,
  MonotoneCubic,
  Slerp,
  None  // Gap left open
};

[[nodiscard]] std::string toString(InterpolationMethod method);

/**
 * @brief Audit trail of every gap bridged by interpolation
 *
 * A fallback is an event whose method differs from the intended one (for
 * example a monotone cubic fill that had to drop to linear because too few
 * valid samples surrounded the gap). The fallback rate feeds the temporal
 * integrity gate.
 *
 * @ticket 0007_gap_filling
 */
class InterpolationLog
{
public:
  struct Event
  {
    std::string joint;
    std::string channel;  // "position" or "orientation"
    InterpolationMethod methodUsed{InterpolationMethod::Linear};
    InterpolationMethod intendedMethod{InterpolationMethod::Linear};
    std::size_t gapFrames{0};
    std::size_t gapStart{0};
    std::size_t gapEnd{0};  // inclusive
    std::string reason;     // set for fallbacks and unfilled gaps

    [[nodiscard]] bool isFallback() const
    {
      return methodUsed != intendedMethod;
    }
  };

  struct JointSummary
  {
    std::size_t totalGaps{0};
    std::size_t framesInterpolated{0};
    std::size_t fallbackCount{0};
    std::size_t maxGapFrames{0};  // longest filled gap
    std::set<InterpolationMethod> methodsUsed;
  };

  struct Summary
  {
    std::size_t totalEvents{0};
    std::size_t totalFallbacks{0};
    double fallbackRate{0.0};  // fallbacks / events, 0 when no events
    std::size_t maxGapFrames{0};
    std::vector<std::string> jointsWithFallbacks;
    std::string overallStatus;  // PRISTINE, GOLD, ACCEPTABLE, REVIEW, CAUTION
  };

  InterpolationLog() = default;

  void record(Event event);

  // Append all events of another log
  void merge(const InterpolationLog& other);

  [[nodiscard]] const std::vector<Event>& events() const
  {
    return events_;
  }

  [[nodiscard]] std::vector<Event> fallbackEvents() const;

  [[nodiscard]] const std::map<std::string, JointSummary>& perJoint() const
  {
    return perJoint_;
  }

  [[nodiscard]] Summary summarize() const;

private:
  std::vector<Event> events_;
  std::map<std::string, JointSummary> perJoint_;
};

}  // namespace mocap_core

#endif  // MOCAP_CORE_INTERPOLATION_LOG_HPP
