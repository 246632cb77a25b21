#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "protocol/twap.hpp"

using Twap = stablesim::protocol::TwapTracker<double>;

TEST(Twap, SeedPriceBeforeFirstSample) {
  Twap t(3.14);
  EXPECT_DOUBLE_EQ(t.twap(), 3.14);
  EXPECT_EQ(t.size(), 0u);
}

TEST(Twap, ConstantWindowYieldsConstant) {
  Twap t(1.0, 16);
  for (uint64_t ts = 0; ts < 40; ++ts) {
    t.update(ts, 0.0031);
    EXPECT_EQ(t.twap(), 0.0031);
  }
  EXPECT_EQ(t.size(), 16u);
  EXPECT_TRUE(t.full());
}

TEST(Twap, PartialWindowAveragesAvailableSamples) {
  Twap t(100.0, 16);
  t.update(0, 1.0);
  t.update(1, 2.0);
  t.update(2, 3.0);
  EXPECT_FALSE(t.full());
  EXPECT_DOUBLE_EQ(t.twap(), 2.0);
}

TEST(Twap, WeightsByDurationUntilNextSample) {
  Twap t(100.0, 16);
  t.update(0, 1.0);
  t.update(3, 4.0);
  // 1.0 held for 3h, 4.0 for one sample interval
  EXPECT_DOUBLE_EQ(t.twap(), 1.75);
}

TEST(Twap, EvictsSamplesOutsideHorizon) {
  Twap t(0.0, 4);
  for (uint64_t ts = 0; ts < 10; ++ts) {
    t.update(ts, static_cast<double>(ts));
  }
  ASSERT_EQ(t.size(), 4u);
  EXPECT_EQ(t.samples().front().ts, 6u);
  EXPECT_DOUBLE_EQ(t.twap(), 7.5);
}

TEST(Twap, RejectsNonIncreasingTimestamps) {
  Twap t(1.0);
  t.update(5, 1.0);
  EXPECT_THROW(t.update(5, 1.0), stablesim::InvalidAmount);
  EXPECT_THROW(t.update(4, 1.0), stablesim::InvalidAmount);
}
