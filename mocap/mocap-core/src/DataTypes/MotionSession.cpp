// Ticket: 0003_session_data_model

#include "mocap-core/src/DataTypes/MotionSession.hpp"

#include <stdexcept>

namespace mocap_core
{

MotionSession::MotionSession(std::string runId,
                             Skeleton skeleton,
                             std::vector<double> times,
                             std::vector<JointTrack> tracks)
  : runId_{std::move(runId)},
    skeleton_{std::move(skeleton)},
    times_{std::move(times)},
    tracks_{std::move(tracks)}
{
  validate();
}

void MotionSession::validate() const
{
  if (tracks_.size() != skeleton_.size())
  {
    throw std::invalid_argument{"MotionSession: expected " +
                                std::to_string(skeleton_.size()) +
                                " joint tracks, got " +
                                std::to_string(tracks_.size())};
  }

  for (std::size_t i = 1; i < times_.size(); ++i)
  {
    if (!(times_[i] > times_[i - 1]))
    {
      throw std::runtime_error{
        "MotionSession: time is not strictly increasing at frame " +
        std::to_string(i) + " (run " + runId_ + ")"};
    }
  }

  for (JointIndex j = 0; j < tracks_.size(); ++j)
  {
    const auto& track = tracks_[j];
    if (static_cast<std::size_t>(track.positions.rows()) != times_.size() ||
        track.orientations.size() != times_.size())
    {
      throw std::invalid_argument{"MotionSession: track for joint '" +
                                  skeleton_.name(j) +
                                  "' does not match the frame count"};
    }
  }
}

double MotionSession::duration() const
{
  if (times_.size() < 2)
  {
    return 0.0;
  }
  return times_.back() - times_.front();
}

Frame MotionSession::frame(std::size_t index) const
{
  return Frame{index, times_.at(index)};
}

Pose MotionSession::pose(JointIndex joint, std::size_t frameIndex) const
{
  const auto& track = tracks_.at(joint);
  if (frameIndex >= times_.size())
  {
    throw std::out_of_range{"MotionSession: frame index out of range"};
  }
  return Pose{track.orientations[frameIndex],
              track.positions.row(static_cast<Eigen::Index>(frameIndex))
                .transpose()};
}

MotionSession MotionSession::withTrack(JointIndex joint, JointTrack track) const
{
  auto tracks = tracks_;
  tracks.at(joint) = std::move(track);
  return MotionSession{runId_, skeleton_, times_, std::move(tracks)};
}

MotionSession MotionSession::withTracks(std::vector<double> times,
                                        std::vector<JointTrack> tracks) const
{
  return MotionSession{runId_, skeleton_, std::move(times), std::move(tracks)};
}

}  // namespace mocap_core
