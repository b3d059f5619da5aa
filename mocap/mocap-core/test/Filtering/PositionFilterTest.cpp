// Ticket: 0009_adaptive_cutoff

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "mocap-core/src/Filtering/ButterworthFilter.hpp"
#include "mocap-core/src/Filtering/PositionFilter.hpp"
#include "mocap-core/test/Helpers/SyntheticSession.hpp"

using namespace mocap_core;
using mocap_core::test::SyntheticCapture;
using mocap_core::test::SyntheticSession;

namespace
{

MotionSession capture()
{
  SyntheticCapture settings;
  settings.noiseMm = 2.0;
  return SyntheticSession::capture(settings);
}

bool contains(const std::vector<std::string>& names, const std::string& name)
{
  return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

// ============================================================================
// Fixed mode
// ============================================================================

TEST(PositionFilterTest, Fixed_UsesConfiguredCutoff)
{
  auto const session = capture();
  PositionFilter::Config config;
  config.mode = FilterMode::Fixed;
  config.fixedCutoffHz = 8.0;

  auto const result = PositionFilter::apply(session, 120.0, config);

  EXPECT_DOUBLE_EQ(result.decision.cutoffHz, 8.0);
  EXPECT_EQ(result.decision.method, "config_fixed");
  EXPECT_TRUE(result.decision.passthroughChannels.empty());
  EXPECT_EQ(result.session.frameCount(), session.frameCount());
}

TEST(PositionFilterTest, Fixed_ReducesFrameToFrameNoise)
{
  auto const session = capture();
  PositionFilter::Config config;
  config.mode = FilterMode::Fixed;

  auto const result = PositionFilter::apply(session, 120.0, config);

  // Hips z carries noise only
  auto const hips = *session.skeleton().indexOf("Hips");
  std::vector<double> raw;
  std::vector<double> smooth;
  for (Eigen::Index i = 0; i < session.track(hips).positions.rows(); ++i)
  {
    raw.push_back(session.track(hips).positions(i, 2));
    smooth.push_back(result.session.track(hips).positions(i, 2));
  }
  EXPECT_LT(PositionFilter::dynamicsScore(smooth),
            0.5 * PositionFilter::dynamicsScore(raw));
}

TEST(PositionFilterTest, CutoffNearNyquist_PassesChannelsThrough)
{
  auto const session = capture();
  PositionFilter::Config config;
  config.mode = FilterMode::Fixed;
  config.fixedCutoffHz = 59.5;

  auto const result = PositionFilter::apply(session, 120.0, config);

  EXPECT_EQ(result.decision.passthroughChannels.size(),
            3 * session.jointCount());
  EXPECT_TRUE(result.session.track(0).positions.isApprox(
    session.track(0).positions));
}

TEST(PositionFilterTest, Fixed_NonPositiveCutoff_Throws)
{
  auto const session = capture();
  PositionFilter::Config config;
  config.mode = FilterMode::Fixed;
  config.fixedCutoffHz = 0.0;

  EXPECT_THROW((void)PositionFilter::apply(session, 120.0, config),
               std::invalid_argument);
}

// ============================================================================
// NaN handling
// ============================================================================

TEST(PositionFilterTest, NanSample_FiniteSpansFilteredAndNanKept)
{
  auto const session = capture();
  auto const head = *session.skeleton().indexOf("Head");
  auto track = session.track(head);
  track.positions(100, 0) = std::numeric_limits<double>::quiet_NaN();
  auto const withGap = session.withTrack(head, track);

  PositionFilter::Config config;
  config.mode = FilterMode::Fixed;
  auto const result = PositionFilter::apply(withGap, 120.0, config);

  EXPECT_TRUE(result.decision.excludedChannels.empty());
  ASSERT_EQ(result.decision.partialChannels.size(), 1u);
  EXPECT_EQ(result.decision.partialChannels[0], "Head__px");
  EXPECT_TRUE(std::isnan(result.session.track(head).positions(100, 0)));

  std::vector<double> before(100);
  for (Eigen::Index i = 0; i < 100; ++i)
  {
    before[static_cast<std::size_t>(i)] = withGap.track(head).positions(i, 0);
  }
  auto const expected = ButterworthFilter::lowpass(before, 8.0, 120.0);
  EXPECT_NEAR(result.session.track(head).positions(50, 0), expected[50], 1e-9);
  EXPECT_NE(result.session.track(head).positions(50, 0),
            withGap.track(head).positions(50, 0));
}

TEST(PositionFilterTest, TrailingNan_RestOfChannelStillFiltered)
{
  auto const session = capture();
  auto const hand = *session.skeleton().indexOf("RightHand");
  auto const last = static_cast<Eigen::Index>(session.frameCount()) - 1;
  auto track = session.track(hand);
  for (Eigen::Index i = last - 1; i <= last; ++i)
  {
    track.positions.row(i).setConstant(std::numeric_limits<double>::quiet_NaN());
  }
  auto const withGap = session.withTrack(hand, track);

  PositionFilter::Config config;
  config.mode = FilterMode::Fixed;
  auto const result = PositionFilter::apply(withGap, 120.0, config);

  EXPECT_EQ(result.decision.partialChannels.size(), 3u);
  EXPECT_TRUE(contains(result.decision.partialChannels, "RightHand__py"));
  EXPECT_TRUE(result.decision.excludedChannels.empty());

  const auto& filtered = result.session.track(hand).positions;
  EXPECT_TRUE(std::isnan(filtered(last, 1)));
  auto const raw = withGap.track(hand).positions.topRows(last - 1);
  auto const out = filtered.topRows(last - 1);
  // Filtering removes the 2 mm frame-to-frame noise
  EXPECT_FALSE(out.isApprox(raw));
  EXPECT_TRUE(out.allFinite());
}

TEST(PositionFilterTest, AllNanChannel_ExcludedAndLeftUntouched)
{
  auto const session = capture();
  auto const head = *session.skeleton().indexOf("Head");
  auto track = session.track(head);
  track.positions.col(2).setConstant(std::numeric_limits<double>::quiet_NaN());
  auto const withGap = session.withTrack(head, track);

  PositionFilter::Config config;
  config.mode = FilterMode::Fixed;
  auto const result = PositionFilter::apply(withGap, 120.0, config);

  ASSERT_EQ(result.decision.excludedChannels.size(), 1u);
  EXPECT_EQ(result.decision.excludedChannels[0], "Head__pz");
  EXPECT_TRUE(result.decision.partialChannels.empty());
  EXPECT_TRUE(std::isnan(result.session.track(head).positions(50, 2)));
}

// ============================================================================
// Global mode
// ============================================================================

TEST(PositionFilterTest, Global_MedianOfRepresentatives)
{
  auto const session = capture();
  PositionFilter::Config config;
  config.mode = FilterMode::Global;
  config.representativeCount = 5;

  auto const result = PositionFilter::apply(session, 120.0, config);
  const auto& decision = result.decision;

  ASSERT_EQ(decision.representativeSignals.size(), 5u);
  ASSERT_EQ(decision.individualCutoffs.size(), 5u);
  EXPECT_GE(decision.cutoffHz, 1.0);
  EXPECT_LE(decision.cutoffHz, 16.0);
  EXPECT_EQ(decision.method, "multi_signal_median(5_channels)");
  EXPECT_FALSE(decision.testFrequencies.empty());
}

TEST(PositionFilterTest, Global_RepresentativesAreMostDynamic)
{
  auto const session = capture();
  auto const result = PositionFilter::apply(session, 120.0, {});

  // The moving x and y channels outrank the noise-only z channels
  for (const auto& name : result.decision.representativeSignals)
  {
    EXPECT_NE(name.substr(name.size() - 2), "pz") << name;
  }
}

// ============================================================================
// Per-region mode
// ============================================================================

TEST(PositionFilterTest, PerRegion_UsesRegionProfiles)
{
  auto const session = capture();
  PositionFilter::Config config;
  config.mode = FilterMode::PerRegion;

  auto const result = PositionFilter::apply(session, 120.0, config);
  const auto& decision = result.decision;

  EXPECT_EQ(decision.method, "fixed_per_region");
  ASSERT_EQ(decision.regions.size(), 4u);
  for (const auto& region : decision.regions)
  {
    EXPECT_DOUBLE_EQ(region.cutoffHz, profileOf(region.region).fixedCutoff);
    EXPECT_TRUE(region.suggestedHz.has_value());
    EXPECT_TRUE(region.validationStatus == "VALID" ||
                region.validationStatus == "AGGRESSIVE");
    EXPECT_FALSE(region.joints.empty());
  }
}

TEST(PositionFilterTest, PerRegion_GroupsTrunkJoints)
{
  auto const session = capture();
  PositionFilter::Config config;
  config.mode = FilterMode::PerRegion;

  auto const result = PositionFilter::apply(session, 120.0, config);

  auto const trunk = std::find_if(result.decision.regions.begin(),
                                  result.decision.regions.end(),
                                  [](const RegionFilterDecision& r)
                                  { return r.region == BodyRegion::Trunk; });
  ASSERT_NE(trunk, result.decision.regions.end());
  EXPECT_TRUE(contains(trunk->joints, "Hips"));
  EXPECT_TRUE(contains(trunk->joints, "Spine"));
  EXPECT_FALSE(contains(trunk->joints, "Head"));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(PositionFilterTest, ChannelName_Format)
{
  EXPECT_EQ(PositionFilter::channelName("LeftHand", 0), "LeftHand__px");
  EXPECT_EQ(PositionFilter::channelName("LeftHand", 2), "LeftHand__pz");
}

TEST(PositionFilterTest, ToString_FilterMode)
{
  EXPECT_EQ(toString(FilterMode::PerRegion), "per_region");
  EXPECT_EQ(toString(FilterMode::Global), "global");
  EXPECT_EQ(toString(FilterMode::Fixed), "fixed");
}
