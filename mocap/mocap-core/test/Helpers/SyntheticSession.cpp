// Ticket: 0016_conditioning_pipeline

#include "mocap-core/test/Helpers/SyntheticSession.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <utility>

#include "mocap-core/src/Quaternion/QuaternionOps.hpp"

namespace mocap_core::test
{

Skeleton SyntheticSession::upperBody()
{
  return Skeleton::fromParentNames({{"Hips", ""},
                                    {"Spine", "Hips"},
                                    {"Head", "Spine"},
                                    {"LeftShoulder", "Spine"},
                                    {"LeftElbow", "LeftShoulder"},
                                    {"LeftHand", "LeftElbow"},
                                    {"RightShoulder", "Spine"},
                                    {"RightElbow", "RightShoulder"},
                                    {"RightHand", "RightElbow"}});
}

std::vector<double> SyntheticSession::uniformTimes(double fs, std::size_t n, double t0)
{
  std::vector<double> times(n);
  for (std::size_t i = 0; i < n; ++i)
  {
    times[i] = t0 + static_cast<double>(i) / fs;
  }
  return times;
}

QuaternionSeries SyntheticSession::constantRotation(const Eigen::Vector3d& axis,
                                                    double rateRadPerSec,
                                                    std::span<const double> times)
{
  Eigen::Vector3d const unit = axis.normalized();
  QuaternionSeries series;
  series.reserve(times.size());
  for (double const t : times)
  {
    double const angle = rateRadPerSec * (t - times.front());
    series.push_back(QuaternionOps::fromRotationVector(unit * angle));
  }
  return series;
}

Eigen::Vector3d SyntheticSession::restPosition(const std::string& jointName)
{
  static const std::map<std::string, Eigen::Vector3d> kRest{
    {"Hips", Eigen::Vector3d{0.0, 1000.0, 0.0}},
    {"Spine", Eigen::Vector3d{0.0, 1250.0, 0.0}},
    {"Head", Eigen::Vector3d{0.0, 1650.0, 0.0}},
    {"LeftShoulder", Eigen::Vector3d{-180.0, 1450.0, 0.0}},
    {"LeftElbow", Eigen::Vector3d{-480.0, 1450.0, 0.0}},
    {"LeftHand", Eigen::Vector3d{-750.0, 1450.0, 0.0}},
    {"RightShoulder", Eigen::Vector3d{180.0, 1450.0, 0.0}},
    {"RightElbow", Eigen::Vector3d{480.0, 1450.0, 0.0}},
    {"RightHand", Eigen::Vector3d{750.0, 1450.0, 0.0}}};
  return kRest.at(jointName);
}

MotionSession SyntheticSession::capture(const SyntheticCapture& settings)
{
  Skeleton skeleton = upperBody();
  auto const n = static_cast<std::size_t>(
    std::round((settings.staticSeconds + settings.movingSeconds) * settings.fs)) + 1;
  auto times = uniformTimes(settings.fs, n);

  std::mt19937 rng{settings.seed};
  std::normal_distribution<double> noise{0.0, settings.noiseMm};

  std::vector<JointTrack> tracks(skeleton.size());
  for (JointIndex j = 0; j < skeleton.size(); ++j)
  {
    double const phase = 0.3 * static_cast<double>(j);
    Eigen::Vector3d const rest = restPosition(skeleton.name(j));
    Eigen::Vector3d const axis =
      Eigen::Vector3d{1.0, 0.5 * static_cast<double>(j % 3), 0.25}.normalized();
    QuaternionD const base =
      QuaternionOps::fromRotationVector(Eigen::Vector3d::UnitY() * 0.1 *
                                        static_cast<double>(j));

    auto& track = tracks[j];
    track.positions.resize(static_cast<Eigen::Index>(n), 3);
    track.orientations.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
      double const moving = std::max(0.0, times[i] - settings.staticSeconds);
      double const wave =
        std::sin(2.0 * M_PI * settings.positionHz * moving + phase) - std::sin(phase);
      auto const row = static_cast<Eigen::Index>(i);
      track.positions(row, 0) = rest.x() + settings.amplitudeMm * wave + noise(rng);
      track.positions(row, 1) = rest.y() + 0.5 * settings.amplitudeMm * wave + noise(rng);
      track.positions(row, 2) = rest.z() + noise(rng);

      double const angle = settings.rotationAmplitudeRad *
                           std::sin(2.0 * M_PI * settings.rotationHz * moving);
      track.orientations.push_back(QuaternionOps::compose(
        base, QuaternionOps::fromRotationVector(axis * angle)));
    }
  }

  return MotionSession{settings.runId, std::move(skeleton), std::move(times),
                       std::move(tracks)};
}

}  // namespace mocap_core::test
