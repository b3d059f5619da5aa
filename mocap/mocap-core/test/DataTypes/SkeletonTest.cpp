// Ticket: 0003_session_data_model

#include <gtest/gtest.h>

#include <stdexcept>

#include "mocap-core/src/DataTypes/Skeleton.hpp"

using namespace mocap_core;

// ============================================================================
// Construction
// ============================================================================

TEST(SkeletonTest, ParentIndices_AreResolved)
{
  Skeleton const skeleton{{"Hips", "Spine", "Head"}, {Skeleton::kNoParent, 0, 1}};

  ASSERT_EQ(skeleton.size(), 3u);
  EXPECT_FALSE(skeleton.parent(0).has_value());
  EXPECT_EQ(skeleton.parent(2).value(), 1u);
  EXPECT_EQ(skeleton.root().value(), 0u);
  EXPECT_EQ(skeleton.indexOf("Head").value(), 2u);
  EXPECT_FALSE(skeleton.indexOf("Tail").has_value());
}

TEST(SkeletonTest, FromParentNames_AcceptsAnyDeclarationOrder)
{
  auto const skeleton =
    Skeleton::fromParentNames({{"Hand", "Elbow"}, {"Elbow", "Hips"}, {"Hips", ""}});

  EXPECT_EQ(skeleton.root().value(), 2u);
  EXPECT_EQ(skeleton.parent(0).value(), 1u);

  // Parents come before children in traversal order
  const auto& order = skeleton.topologicalOrder();
  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[0], 2u);
  EXPECT_EQ(order[1], 1u);
  EXPECT_EQ(order[2], 0u);
}

// ============================================================================
// Invariant violations
// ============================================================================

TEST(SkeletonTest, DuplicateName_Throws)
{
  EXPECT_THROW((Skeleton{{"Hips", "Hips"}, {Skeleton::kNoParent, 0}}),
               std::invalid_argument);
}

TEST(SkeletonTest, ParentOutOfRange_Throws)
{
  EXPECT_THROW((Skeleton{{"Hips", "Spine"}, {Skeleton::kNoParent, 5}}),
               std::invalid_argument);
}

TEST(SkeletonTest, Cycle_Throws)
{
  EXPECT_THROW((Skeleton{{"A", "B"}, {1, 0}}), std::invalid_argument);
}

TEST(SkeletonTest, UnknownParentName_Throws)
{
  EXPECT_THROW(Skeleton::fromParentNames({{"Hips", ""}, {"Spine", "Pelvis"}}),
               std::invalid_argument);
}
