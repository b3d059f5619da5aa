// Ticket: 0007_gap_filling

#include "mocap-core/src/Resampling/GapFiller.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"
#include "mocap-core/src/Resampling/Interpolation.hpp"

namespace mocap_core
{

namespace
{

struct Run
{
  std::size_t start;
  std::size_t end;  // inclusive
};

std::vector<Run> missingRuns(const std::vector<bool>& valid)
{
  std::vector<Run> runs;
  std::size_t i = 0;
  while (i < valid.size())
  {
    if (valid[i])
    {
      ++i;
      continue;
    }
    std::size_t const start = i;
    while (i < valid.size() && !valid[i])
    {
      ++i;
    }
    runs.push_back(Run{start, i - 1});
  }
  return runs;
}

// Empty reason means the gap may be filled
std::string eligibility(const Run& run,
                        const std::vector<double>& times,
                        double ceiling)
{
  if (run.start == 0 || run.end + 1 >= times.size())
  {
    return "boundary gap is never filled";
  }
  double const span = times[run.end + 1] - times[run.start - 1];
  if (span > ceiling)
  {
    return "gap exceeds the fill ceiling";
  }
  return {};
}

}  // namespace

GapFiller::Result GapFiller::fill(const MotionSession& session,
                                  const Config& config)
{
  const auto& times = session.times();
  std::size_t const n = times.size();
  const auto& skeleton = session.skeleton();

  InterpolationLog log;
  std::size_t framesFilled = 0;
  std::size_t gapsLeftOpen = 0;
  std::vector<JointTrack> tracks = session.tracks();

  for (JointIndex j = 0; j < tracks.size(); ++j)
  {
    auto& track = tracks[j];
    const std::string& jointName = skeleton.name(j);

    // ---- Positions ----
    std::vector<bool> posValid(n);
    std::vector<double> validTimes;
    std::array<std::vector<double>, 3> validValues;
    for (std::size_t i = 0; i < n; ++i)
    {
      auto const row = static_cast<Eigen::Index>(i);
      posValid[i] = track.positions.row(row).allFinite();
      if (posValid[i])
      {
        validTimes.push_back(times[i]);
        for (Eigen::Index axis = 0; axis < 3; ++axis)
        {
          validValues[static_cast<std::size_t>(axis)].push_back(
            track.positions(row, axis));
        }
      }
    }

    for (const auto& run : missingRuns(posValid))
    {
      InterpolationLog::Event event;
      event.joint = jointName;
      event.channel = "position";
      event.intendedMethod = InterpolationMethod::MonotoneCubic;
      event.gapStart = run.start;
      event.gapEnd = run.end;
      event.gapFrames = run.end - run.start + 1;

      std::string const blocked =
        eligibility(run, times, config.maxPositionGapSeconds);
      if (!blocked.empty())
      {
        event.methodUsed = InterpolationMethod::None;
        event.reason = blocked;
        ++gapsLeftOpen;
        log.record(std::move(event));
        continue;
      }

      std::vector<double> gapTimes(times.begin() + static_cast<std::ptrdiff_t>(run.start),
                                   times.begin() + static_cast<std::ptrdiff_t>(run.end + 1));
      bool const cubic = validTimes.size() >= config.minCubicSamples;
      for (Eigen::Index axis = 0; axis < 3; ++axis)
      {
        const auto& values = validValues[static_cast<std::size_t>(axis)];
        std::vector<double> filled =
          cubic ? MonotoneCubic{validTimes, values}.evaluate(gapTimes)
                : Interpolation::linear(validTimes, values, gapTimes);
        for (std::size_t k = 0; k < filled.size(); ++k)
        {
          track.positions(static_cast<Eigen::Index>(run.start + k), axis) =
            filled[k];
        }
      }

      event.methodUsed =
        cubic ? InterpolationMethod::MonotoneCubic : InterpolationMethod::Linear;
      if (!cubic)
      {
        event.reason = "fewer than " + std::to_string(config.minCubicSamples) +
                       " valid samples for monotone cubic";
      }
      framesFilled += event.gapFrames;
      log.record(std::move(event));
    }

    // ---- Orientations ----
    std::vector<bool> quatValid(n);
    for (std::size_t i = 0; i < n; ++i)
    {
      quatValid[i] = track.orientations[i].allFinite();
    }

    for (const auto& run : missingRuns(quatValid))
    {
      InterpolationLog::Event event;
      event.joint = jointName;
      event.channel = "orientation";
      event.intendedMethod = InterpolationMethod::Slerp;
      event.gapStart = run.start;
      event.gapEnd = run.end;
      event.gapFrames = run.end - run.start + 1;

      std::string const blocked =
        eligibility(run, times, config.maxOrientationGapSeconds);
      if (!blocked.empty())
      {
        event.methodUsed = InterpolationMethod::None;
        event.reason = blocked;
        ++gapsLeftOpen;
        log.record(std::move(event));
        continue;
      }

      const auto& before = track.orientations[run.start - 1];
      const auto& after = track.orientations[run.end + 1];
      double const t0 = times[run.start - 1];
      double const span = times[run.end + 1] - t0;
      for (std::size_t i = run.start; i <= run.end; ++i)
      {
        track.orientations[i] =
          QuaternionOps::slerp(before, after, (times[i] - t0) / span);
      }

      event.methodUsed = InterpolationMethod::Slerp;
      framesFilled += event.gapFrames;
      log.record(std::move(event));
    }
    track.orientations = QuaternionOps::normalizeSeries(track.orientations);
  }

  auto const summary = log.summarize();
  if (gapsLeftOpen > 0)
  {
    spdlog::warn("GapFiller: run {} left {} gap(s) open", session.runId(),
                 gapsLeftOpen);
  }
  spdlog::debug("GapFiller: run {} filled {} frame(s), {} fallback(s), status {}",
                session.runId(),
                framesFilled,
                summary.totalFallbacks,
                summary.overallStatus);

  return Result{session.withTracks(times, std::move(tracks)),
                std::move(log),
                framesFilled,
                gapsLeftOpen};
}

}  // namespace mocap_core
