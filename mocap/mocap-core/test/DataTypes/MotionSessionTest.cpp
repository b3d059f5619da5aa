// Ticket: 0003_session_data_model

#include <gtest/gtest.h>

#include <stdexcept>

#include "mocap-core/src/DataTypes/MotionSession.hpp"

using namespace mocap_core;

namespace
{

JointTrack constantTrack(std::size_t n, double x)
{
  JointTrack track;
  track.positions = Eigen::MatrixX3d::Constant(static_cast<Eigen::Index>(n), 3, x);
  track.orientations.assign(n, QuaternionD{1.0, 0.0, 0.0, 0.0});
  return track;
}

Skeleton twoJoints()
{
  return Skeleton{{"Hips", "Spine"}, {Skeleton::kNoParent, 0}};
}

}  // namespace

TEST(MotionSessionTest, Accessors_ReturnStoredData)
{
  MotionSession const session{"take", twoJoints(), {0.0, 0.5, 1.0},
                              {constantTrack(3, 1.0), constantTrack(3, 2.0)}};

  EXPECT_EQ(session.runId(), "take");
  EXPECT_EQ(session.frameCount(), 3u);
  EXPECT_EQ(session.jointCount(), 2u);
  EXPECT_DOUBLE_EQ(session.duration(), 1.0);
  EXPECT_DOUBLE_EQ(session.frame(1).time, 0.5);
  EXPECT_DOUBLE_EQ(session.pose(1, 2).position.x(), 2.0);
  EXPECT_THROW((void)session.pose(0, 3), std::out_of_range);
}

TEST(MotionSessionTest, NonIncreasingTime_IsFatal)
{
  EXPECT_THROW((MotionSession{"take", twoJoints(), {0.0, 0.5, 0.5},
                              {constantTrack(3, 0.0), constantTrack(3, 0.0)}}),
               std::runtime_error);
}

TEST(MotionSessionTest, TrackCountMismatch_Throws)
{
  EXPECT_THROW((MotionSession{"take", twoJoints(), {0.0, 1.0}, {constantTrack(2, 0.0)}}),
               std::invalid_argument);
}

TEST(MotionSessionTest, TrackLengthMismatch_Throws)
{
  EXPECT_THROW((MotionSession{"take", twoJoints(), {0.0, 1.0},
                              {constantTrack(2, 0.0), constantTrack(3, 0.0)}}),
               std::invalid_argument);
}

TEST(MotionSessionTest, WithTrack_LeavesOriginalUntouched)
{
  MotionSession const session{"take", twoJoints(), {0.0, 1.0},
                              {constantTrack(2, 0.0), constantTrack(2, 0.0)}};

  auto const patched = session.withTrack(1, constantTrack(2, 9.0));

  EXPECT_DOUBLE_EQ(patched.pose(1, 0).position.y(), 9.0);
  EXPECT_DOUBLE_EQ(session.pose(1, 0).position.y(), 0.0);
}
