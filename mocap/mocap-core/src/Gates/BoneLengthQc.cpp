// Ticket: 0019_bone_length_qc

#include "mocap-core/src/Gates/BoneLengthQc.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "mocap-core/src/Utils/Statistics.hpp"

namespace mocap_core
{

std::string toString(BoneStatus status)
{
  switch (status)
  {
    case BoneStatus::Pass:
      return "PASS";
    case BoneStatus::Warn:
      return "WARN";
    case BoneStatus::Alert:
      return "ALERT";
  }
  return "UNKNOWN";
}

std::vector<std::string> BoneLengthQc::Report::flaggedBones() const
{
  std::vector<std::string> out;
  for (const auto& bone : bones)
  {
    if (bone.status != BoneStatus::Pass)
    {
      out.push_back(bone.name() + " " + toString(bone.status));
    }
  }
  return out;
}

BoneLengthStats BoneLengthQc::measure(const std::vector<double>& lengths,
                                      const Config& config)
{
  if (lengths.empty())
  {
    throw std::invalid_argument{"BoneLengthQc: empty length series"};
  }

  BoneLengthStats s;
  s.validFrames = lengths.size();
  s.medianLength = stats::median(lengths);
  s.meanLength = stats::mean(lengths);
  s.stdLength = stats::stddev(lengths);
  s.cv = s.meanLength > 0.0 ? s.stdLength / s.meanLength
                            : std::numeric_limits<double>::infinity();

  std::vector<double> deviation(lengths.size());
  std::transform(lengths.begin(),
                 lengths.end(),
                 deviation.begin(),
                 [&s](double l) { return std::abs(l - s.medianLength); });
  s.p95AbsDeviation = stats::percentile(deviation, 95.0);

  for (std::size_t i = 1; i < lengths.size(); ++i)
  {
    s.maxJump = std::max(s.maxJump, std::abs(lengths[i] - lengths[i - 1]));
  }

  if (s.cv > config.cvAlert || s.maxJump > config.maxJumpAlert)
  {
    s.status = BoneStatus::Alert;
  }
  else if (s.cv > config.cvWarn || s.p95AbsDeviation > config.p95AbsDevWarn)
  {
    s.status = BoneStatus::Warn;
  }
  return s;
}

BoneLengthQc::Report BoneLengthQc::analyze(const MotionSession& session,
                                           const Config& config)
{
  Report report;
  const auto& skeleton = session.skeleton();
  for (JointIndex child = 0; child < skeleton.size(); ++child)
  {
    auto const parent = skeleton.parent(child);
    if (!parent)
    {
      continue;
    }
    const auto& p = session.track(*parent).positions;
    const auto& c = session.track(child).positions;

    std::vector<double> lengths;
    lengths.reserve(static_cast<std::size_t>(c.rows()));
    for (Eigen::Index i = 0; i < c.rows(); ++i)
    {
      if (p.row(i).allFinite() && c.row(i).allFinite())
      {
        lengths.push_back((c.row(i) - p.row(i)).norm());
      }
    }
    if (lengths.size() < config.minValidFrames)
    {
      spdlog::debug("BoneLengthQc: {}->{} has {} valid frame(s), skipped",
                    skeleton.name(*parent),
                    skeleton.name(child),
                    lengths.size());
      continue;
    }

    auto bone = measure(lengths, config);
    bone.parent = skeleton.name(*parent);
    bone.child = skeleton.name(child);
    report.maxCv = std::max(report.maxCv, bone.cv);
    if (bone.status == BoneStatus::Warn)
    {
      ++report.warnCount;
    }
    else if (bone.status == BoneStatus::Alert)
    {
      ++report.alertCount;
      spdlog::warn("BoneLengthQc: {} cv {:.3f}, max jump {:.1f} mm",
                   bone.name(),
                   bone.cv,
                   bone.maxJump);
    }
    report.bones.push_back(std::move(bone));
  }

  spdlog::info("BoneLengthQc: {} bone(s), {} warn, {} alert, max cv {:.3f}",
               report.bones.size(),
               report.warnCount,
               report.alertCount,
               report.maxCv);
  return report;
}

BoneLengthQc::Report BoneLengthQc::analyze(const MotionSession& session)
{
  return analyze(session, Config{});
}

}  // namespace mocap_core
