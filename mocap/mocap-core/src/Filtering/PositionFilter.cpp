// Ticket: 0009_adaptive_cutoff

#include "mocap-core/src/Filtering/PositionFilter.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <span>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "mocap-core/src/Filtering/ButterworthFilter.hpp"
#include "mocap-core/src/Filtering/CutoffSelector.hpp"
#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

namespace
{

constexpr std::size_t kMinSpanFrames = 10;

// Half-open [begin, end) run of finite samples
struct Span
{
  std::size_t begin;
  std::size_t end;

  [[nodiscard]] std::size_t size() const
  {
    return end - begin;
  }
};

struct Channel
{
  JointIndex joint;
  int axis;
  std::string name;
  std::vector<double> values;   // NaN samples kept in place
  std::vector<Span> spans{};     // finite runs long enough to filter
  std::vector<double> longest{};  // samples of the longest span
  double score{0.0};
};

std::vector<Span> finiteSpans(const std::vector<double>& values, std::size_t minLength)
{
  std::vector<Span> spans;
  std::size_t i = 0;
  while (i < values.size())
  {
    if (!std::isfinite(values[i]))
    {
      ++i;
      continue;
    }
    std::size_t end = i;
    while (end < values.size() && std::isfinite(values[end]))
    {
      ++end;
    }
    if (end - i >= minLength)
    {
      spans.push_back(Span{i, end});
    }
    i = end;
  }
  return spans;
}

std::span<const double> samplesOf(const std::vector<double>& values, const Span& span)
{
  return std::span<const double>{values}.subspan(span.begin, span.size());
}

std::vector<double> columnOf(const Eigen::MatrixX3d& positions, int axis)
{
  std::vector<double> out(static_cast<std::size_t>(positions.rows()));
  for (Eigen::Index i = 0; i < positions.rows(); ++i)
  {
    out[static_cast<std::size_t>(i)] = positions(i, axis);
  }
  return out;
}

// Indices of channels sorted by decreasing dynamics score
std::vector<std::size_t> rankByDynamics(const std::vector<Channel>& channels,
                                        const std::vector<std::size_t>& subset)
{
  std::vector<std::size_t> order = subset;
  std::stable_sort(order.begin(),
                   order.end(),
                   [&channels](std::size_t a, std::size_t b)
                   { return channels[a].score > channels[b].score; });
  return order;
}

}  // namespace

std::string toString(FilterMode mode)
{
  switch (mode)
  {
    case FilterMode::Global:
      return "global";
    case FilterMode::PerRegion:
      return "per_region";
    case FilterMode::Fixed:
      return "fixed";
  }
  return "unknown";
}

double PositionFilter::dynamicsScore(const std::vector<double>& signal)
{
  if (signal.size() < 2)
  {
    return 0.0;
  }
  return stats::stddev(stats::diff(signal));
}

std::string PositionFilter::channelName(const std::string& joint, int axis)
{
  static constexpr char kAxes[] = {'x', 'y', 'z'};
  return joint + "__p" + kAxes[axis];
}

PositionFilter::Result PositionFilter::apply(const MotionSession& session,
                                             double fs,
                                             const Config& config)
{
  if (!(fs > 0.0))
  {
    throw std::invalid_argument{"PositionFilter: sampling rate must be positive"};
  }
  if (config.mode == FilterMode::Fixed && !(config.fixedCutoffHz > 0.0))
  {
    throw std::invalid_argument{"PositionFilter: fixed cutoff must be positive"};
  }

  FilterDecision decision;
  decision.mode = config.mode;
  decision.fmin = static_cast<double>(config.fmin);
  decision.fmax = static_cast<double>(config.fmax);

  // ---- Collect channels ----
  std::vector<Channel> channels;
  std::vector<std::size_t> valid;
  for (JointIndex j = 0; j < session.jointCount(); ++j)
  {
    const auto& joint = session.skeleton().name(j);
    for (int axis = 0; axis < 3; ++axis)
    {
      Channel channel{j, axis, channelName(joint, axis),
                      columnOf(session.track(j).positions, axis)};
      channel.spans = finiteSpans(channel.values,
                                  std::min(kMinSpanFrames, channel.values.size()));
      if (channel.spans.empty())
      {
        decision.excludedChannels.push_back(channel.name);
        channels.push_back(std::move(channel));
        continue;
      }
      bool const complete = channel.spans.size() == 1 &&
                            channel.spans.front().size() == channel.values.size();
      if (!complete)
      {
        decision.partialChannels.push_back(channel.name);
      }
      if (config.hampelPrefilter)
      {
        for (const auto& span : channel.spans)
        {
          auto hampel = HampelFilter::apply(samplesOf(channel.values, span), config.hampel);
          decision.hampelOutliers += hampel.outlierCount;
          std::copy(hampel.filtered.begin(),
                    hampel.filtered.end(),
                    channel.values.begin() + static_cast<std::ptrdiff_t>(span.begin));
        }
      }
      auto const longest = std::max_element(
        channel.spans.begin(),
        channel.spans.end(),
        [](const Span& a, const Span& b) { return a.size() < b.size(); });
      auto const samples = samplesOf(channel.values, *longest);
      channel.longest.assign(samples.begin(), samples.end());
      channel.score = dynamicsScore(channel.longest);
      valid.push_back(channels.size());
      channels.push_back(std::move(channel));
    }
  }

  if (!decision.partialChannels.empty())
  {
    spdlog::warn("PositionFilter: {} channel(s) contain NaN, filtering their "
                 "finite spans only",
                 decision.partialChannels.size());
  }
  if (!decision.excludedChannels.empty())
  {
    spdlog::warn("PositionFilter: {} channel(s) have no finite span of {} "
                 "frames and are passed through",
                 decision.excludedChannels.size(),
                 kMinSpanFrames);
  }
  if (valid.empty())
  {
    throw std::invalid_argument{
      "PositionFilter: no position channel has a finite span to filter"};
  }

  std::vector<double> channelCutoff(channels.size(), 0.0);
  auto const ranked = rankByDynamics(channels, valid);

  // ---- Cutoff selection ----
  switch (config.mode)
  {
    case FilterMode::Fixed:
    {
      decision.cutoffHz = config.fixedCutoffHz;
      decision.method = "config_fixed";
      for (std::size_t idx : valid)
      {
        channelCutoff[idx] = decision.cutoffHz;
      }
      break;
    }

    case FilterMode::Global:
    {
      std::size_t const count = std::min(config.representativeCount, ranked.size());
      std::optional<ResidualAnalysis> detailed;
      std::string detailedReason;
      for (std::size_t r = 0; r < count; ++r)
      {
        const auto& channel = channels[ranked[r]];
        bool const trunk = isTrunkJoint(session.skeleton().name(channel.joint));

        CutoffSelector::Config selector;
        selector.fmin = config.fmin;
        selector.fmax = config.fmax;
        selector.region = trunk ? BodyRegion::Trunk : BodyRegion::UpperDistal;
        selector.minCutoff = trunk ? config.trunkMinCutoff : config.distalMinCutoff;

        auto const analysis = CutoffSelector::analyze(channel.longest, fs, selector);
        double const cutoff =
          analysis.hasValue() ? analysis.value().cutoffHz : decision.fmax;
        decision.representativeSignals.push_back(channel.name);
        decision.individualCutoffs.push_back(cutoff);
        spdlog::debug("PositionFilter: {} -> {:.1f} Hz ({})",
                      channel.name,
                      cutoff,
                      toString(selector.region));

        if (r == 0)
        {
          detailedReason = analysis.reason();
          if (analysis.hasValue())
          {
            detailed = analysis.value();
          }
        }
      }

      decision.cutoffHz = stats::median(decision.individualCutoffs);
      decision.method = fmt::format("multi_signal_median({}_channels)", count);
      if (detailed)
      {
        decision.testFrequencies = detailed->testFrequencies;
        decision.residualRms = detailed->residualRms;
        decision.residualRmsFinal = detailed->residualRmsFinal;
      }
      if (!detailedReason.empty())
      {
        decision.failed = true;
        decision.failureReason = detailedReason;
      }
      if (decision.cutoffHz >= decision.fmax - 1.0)
      {
        decision.failed = true;
        if (decision.failureReason.empty())
        {
          decision.failureReason = fmt::format(
            "cutoff at fmax ({:.1f} Hz), data may be pre-smoothed",
            decision.cutoffHz);
        }
      }
      for (std::size_t idx : valid)
      {
        channelCutoff[idx] = decision.cutoffHz;
      }
      break;
    }

    case FilterMode::PerRegion:
    {
      std::map<BodyRegion, std::vector<std::size_t>> byRegion;
      for (std::size_t idx : ranked)
      {
        auto const region =
          classifyJoint(session.skeleton().name(channels[idx].joint));
        byRegion[region].push_back(idx);
      }

      std::vector<std::string> aggressive;
      double cutoffSum = 0.0;
      for (const auto& [region, members] : byRegion)
      {
        RegionProfile const profile = profileOf(region);
        RegionFilterDecision rd;
        rd.region = region;
        rd.cutoffHz = profile.fixedCutoff;
        // members are already ordered by dynamics
        const auto& representative = channels[members.front()];
        rd.representative = representative.name;
        for (std::size_t idx : members)
        {
          const auto& joint = session.skeleton().name(channels[idx].joint);
          if (std::find(rd.joints.begin(), rd.joints.end(), joint) ==
              rd.joints.end())
          {
            rd.joints.push_back(joint);
          }
          channelCutoff[idx] = rd.cutoffHz;
        }

        CutoffSelector::Config selector;
        selector.fmin = config.fmin;
        selector.fmax = config.fmax;
        selector.region = region;
        selector.validationMode = true;
        auto const analysis =
          CutoffSelector::analyze(representative.longest, fs, selector);
        rd.suggestedHz =
          analysis.hasValue() ? analysis.value().rawCutoffHz : decision.fmax;
        rd.validationMethod =
          analysis.hasValue() ? analysis.value().method : analysis.reason();
        rd.validationStatus =
          rd.cutoffHz >= *rd.suggestedHz ? "VALID" : "AGGRESSIVE";
        if (rd.validationStatus == "AGGRESSIVE")
        {
          aggressive.push_back(fmt::format("{} (fixed={:.0f} Hz < suggested="
                                           "{:.1f} Hz)",
                                           toString(region),
                                           rd.cutoffHz,
                                           *rd.suggestedHz));
        }
        if (decision.testFrequencies.empty() && analysis.hasValue() &&
            members.front() == ranked.front())
        {
          decision.testFrequencies = analysis.value().testFrequencies;
          decision.residualRms = analysis.value().residualRms;
          decision.residualRmsFinal = analysis.value().residualRmsFinal;
        }

        spdlog::info("PositionFilter: {} fixed {:.0f} Hz, suggested {:.1f} Hz, "
                     "{}",
                     toString(region),
                     rd.cutoffHz,
                     *rd.suggestedHz,
                     rd.validationStatus);
        decision.representativeSignals.push_back(rd.representative);
        decision.individualCutoffs.push_back(rd.cutoffHz);
        cutoffSum += rd.cutoffHz;
        decision.regions.push_back(std::move(rd));
      }

      decision.cutoffHz = cutoffSum / static_cast<double>(decision.regions.size());
      decision.method = "fixed_per_region";
      if (!aggressive.empty())
      {
        spdlog::info("PositionFilter: fixed cutoffs filter harder than "
                     "suggested for {} region(s)",
                     aggressive.size());
      }
      break;
    }
  }

  // ---- Filtering ----
  std::vector<JointTrack> tracks = session.tracks();
  double const passthroughLimit = 0.5 * fs - 1.0;
  for (std::size_t idx : valid)
  {
    auto& channel = channels[idx];
    auto& positions = tracks[channel.joint].positions;
    std::vector<double> out = channel.values;
    if (channelCutoff[idx] >= passthroughLimit)
    {
      decision.passthroughChannels.push_back(channel.name);
    }
    else
    {
      for (const auto& span : channel.spans)
      {
        auto const filtered = ButterworthFilter::lowpass(
          samplesOf(channel.values, span), channelCutoff[idx], fs);
        std::copy(filtered.begin(),
                  filtered.end(),
                  out.begin() + static_cast<std::ptrdiff_t>(span.begin));
      }
    }
    for (Eigen::Index i = 0; i < positions.rows(); ++i)
    {
      positions(i, channel.axis) = out[static_cast<std::size_t>(i)];
    }
  }

  if (!decision.passthroughChannels.empty())
  {
    spdlog::warn("PositionFilter: {} channel(s) left unfiltered, cutoff at or "
                 "above {:.1f} Hz",
                 decision.passthroughChannels.size(),
                 passthroughLimit);
  }
  if (decision.failed)
  {
    spdlog::warn("PositionFilter: cutoff selection flagged: {}",
                 decision.failureReason);
  }
  spdlog::info("PositionFilter: run {} mode {} cutoff {:.1f} Hz ({}), {}/{} "
               "channels filtered",
               session.runId(),
               toString(decision.mode),
               decision.cutoffHz,
               decision.method,
               valid.size() - decision.passthroughChannels.size(),
               channels.size());

  return Result{session.withTracks(session.times(), std::move(tracks)),
                std::move(decision)};
}

}  // namespace mocap_core
