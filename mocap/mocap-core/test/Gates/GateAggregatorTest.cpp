// Ticket: 0014_quality_gates

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "mocap-core/src/Gates/GateAggregator.hpp"

using namespace mocap_core;

namespace
{

GateVerdict gate(int number, GateStatus status, const std::string& reason)
{
  GateVerdict v;
  v.gate = number;
  v.name = "gate_" + std::to_string(number);
  v.status = status;
  v.reason = reason;
  return v;
}

}  // namespace

TEST(GateAggregatorTest, AllPass_Pass)
{
  auto const overall = GateAggregator::aggregate(
    {gate(2, GateStatus::Pass, ""), gate(3, GateStatus::Pass, "")});

  EXPECT_EQ(overall.status, GateStatus::Pass);
  EXPECT_TRUE(overall.reasons.empty());
  EXPECT_EQ(overall.gates.size(), 2u);
}

TEST(GateAggregatorTest, WorstStatusWins)
{
  auto const overall = GateAggregator::aggregate(
    {gate(2, GateStatus::Review, "REVIEW: Temporal Jitter"),
     gate(4, GateStatus::Reject, "REJECT: Quaternion Normalization"),
     gate(5, GateStatus::AcceptHighIntensity, "")});

  EXPECT_EQ(overall.status, GateStatus::Reject);
  ASSERT_EQ(overall.reasons.size(), 2u);
  EXPECT_EQ(overall.reasons[0], "Gate 2: REVIEW: Temporal Jitter");
  EXPECT_EQ(overall.reasons[1], "Gate 4: REJECT: Quaternion Normalization");
}

TEST(GateAggregatorTest, HighIntensity_OutranksPass)
{
  auto const overall = GateAggregator::aggregate(
    {gate(3, GateStatus::Pass, ""), gate(5, GateStatus::AcceptHighIntensity, "")});

  EXPECT_EQ(overall.status, GateStatus::AcceptHighIntensity);
}

TEST(GateAggregatorTest, ReviewWithoutReason_Throws)
{
  EXPECT_THROW((void)GateAggregator::aggregate({gate(3, GateStatus::Review, "")}),
               std::logic_error);
}
