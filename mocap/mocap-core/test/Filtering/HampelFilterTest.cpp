// Ticket: 0010_hampel_prefilter

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "mocap-core/src/Filtering/HampelFilter.hpp"

using namespace mocap_core;

TEST(HampelFilterTest, IsolatedSpike_ReplacedByMedian)
{
  std::vector<double> signal(30, 10.0);
  signal[15] = 500.0;

  auto const result = HampelFilter::apply(signal);

  EXPECT_EQ(result.outlierCount, 1u);
  EXPECT_TRUE(result.outlierMask[15]);
  EXPECT_DOUBLE_EQ(result.filtered[15], 10.0);
  EXPECT_DOUBLE_EQ(result.filtered[14], 10.0);
}

TEST(HampelFilterTest, SmoothSignal_Untouched)
{
  std::vector<double> signal(50);
  for (std::size_t i = 0; i < signal.size(); ++i)
  {
    signal[i] = 0.5 * static_cast<double>(i) + (i % 2 == 0 ? 0.1 : -0.1);
  }

  auto const result = HampelFilter::apply(signal);

  EXPECT_EQ(result.outlierCount, 0u);
  EXPECT_EQ(result.filtered, signal);
}

TEST(HampelFilterTest, ShorterThanWindow_ReturnedUnchanged)
{
  std::vector<double> const signal{1.0, 100.0, 1.0};
  HampelFilter::Config config;
  config.windowSize = 5;

  auto const result = HampelFilter::apply(signal, config);

  EXPECT_EQ(result.outlierCount, 0u);
  EXPECT_EQ(result.filtered, signal);
}

TEST(HampelFilterTest, ZeroWindow_Throws)
{
  std::vector<double> const signal(10, 1.0);
  HampelFilter::Config config;
  config.windowSize = 0;

  EXPECT_THROW((void)HampelFilter::apply(signal, config), std::invalid_argument);
}
