#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "agents/liquidity_provider.hpp"
#include "agents/position.hpp"
#include "agents/returns.hpp"
#include "agents/shorter.hpp"
#include "agents/trend_long.hpp"
#include "core/errors.hpp"
#include "oracle/price_oracle.hpp"
#include "pools/constant_product.hpp"
#include "pools/helpers.hpp"
#include "protocol/controller.hpp"
#include "protocol/safe_engine.hpp"

using namespace stablesim;
using pools::Asset;

namespace {

protocol::ControllerParams<double> controller_at(double redemption_price) {
  protocol::ControllerParams<double> p{};
  p.kp = 0.00023;
  p.initial_redemption_price = redemption_price;
  return p;
}

std::vector<double> constant_path(size_t n, double price) { return std::vector<double>(n, price); }

// Rises for 700 steps, then falls
std::vector<double> peak_path() {
  std::vector<double> path(2000);
  for (size_t i = 0; i < path.size(); ++i) {
    path[i] = i <= 700 ? 1500.0 + static_cast<double>(i) * (500.0 / 700.0)
                       : 2000.0 - static_cast<double>(i - 700) * (1000.0 / 1299.0);
  }
  return path;
}

struct Market {
  pools::LiquidityPool<double> pool{10000000.0, 20940.0};
  protocol::SafeEngine<double> safes{};
  protocol::Controller<double> controller;
  oracle::PriceOracle<double> oracle;
  std::vector<double> rates{};

  Market(double redemption_price, const std::vector<double>& path)
      : controller(controller_at(redemption_price)), oracle(path, path.size()) {}

  agents::MarketContext<double> ctx(uint64_t step = 0) {
    return agents::MarketContext<double>{pool, safes, controller, oracle, rates,
                                         agents::RewardParams<double>{334.0, 1000000.0},
                                         step, oracle.price_at(step)};
  }
};

} // namespace

TEST(Returns, RewardYieldDoesNotDependOnShareSize) {
  agents::ReturnSnapshot<double> s{};
  s.valuation = 1.5e9;
  s.reward_total_supply = 1e6;
  s.reward_per_day = 334.0;
  s.pool_share = 0.01;
  s.share_value = 41880.0 * 0.01 * 1500.0;
  const double y1 = agents::reward_yield_pct(s);
  s.pool_share = 0.02;
  s.share_value = 41880.0 * 0.02 * 1500.0;
  EXPECT_NEAR(agents::reward_yield_pct(s), y1, 1e-9);
  EXPECT_NEAR(y1, 100.0 * (1500.0 * 334.0 * 365.0 / (41880.0 * 1500.0) - 1.0), 1e-9);
}

TEST(Returns, ConvergenceSignFollowsRate) {
  agents::ReturnSnapshot<double> s{};
  s.forward_redemption_price = 3.3;
  s.market_price = 3.0;
  s.redemption_rate = 1e-5;
  EXPECT_NEAR(agents::convergence_pct(s), 10.0, 1e-9);
  s.redemption_rate = 0.0;
  EXPECT_NEAR(agents::convergence_pct(s), -10.0, 1e-9);
}

TEST(LiquidityProvider, EntersWithWholeWalletAndExitsCompletely) {
  Market m(3.14, constant_path(10, 1500.0));
  agents::LiquidityProvider<double> lp(0, 300.0, 1.5e9, 100.0);
  const double market_before = m.pool.spot_price() * 1500.0;

  auto ctx = m.ctx();
  lp.decide_and_act(ctx);
  ASSERT_TRUE(lp.in_position());
  EXPECT_EQ(lp.wallet().ref, 0.0);
  EXPECT_GT(lp.diagnostics().expected_return, 100.0);
  EXPECT_NEAR(m.pool.total_supply, m.pool.seed_shares + lp.wallet().shares, 1e-9 * m.pool.total_supply);
  EXPECT_GT(m.pool.spot_price() * 1500.0, market_before);

  lp.exit(ctx);
  EXPECT_FALSE(lp.in_position());
  EXPECT_NEAR(lp.wallet().ref, 300.0, 1e-6);
  EXPECT_NEAR(m.pool.reserve(Asset::Ref), 20940.0, 1e-6);
  EXPECT_NEAR(m.pool.total_supply, m.pool.seed_shares, 1e-9 * m.pool.total_supply);
}

TEST(LiquidityProvider, StaysOutBelowThreshold) {
  Market m(3.14, constant_path(10, 1500.0));
  agents::LiquidityProvider<double> lp(0, 300.0, 1.5e9, 1000.0);
  auto ctx = m.ctx();
  lp.decide_and_act(ctx);
  EXPECT_FALSE(lp.in_position());
  EXPECT_EQ(lp.wallet().ref, 300.0);
  EXPECT_DOUBLE_EQ(m.pool.reserve(Asset::Ref), 20940.0);
}

TEST(LiquidityProvider, DustWalletStaysOut) {
  Market m(3.14, constant_path(10, 1500.0));
  agents::LiquidityProvider<double> lp(0, 1e-13, 1.5e9, 100.0);
  ASSERT_EQ(pools::entire_wallet_swap_size(1e-13, 20940.0), 0.0);

  auto ctx = m.ctx();
  EXPECT_NO_THROW(lp.decide_and_act(ctx));
  EXPECT_FALSE(lp.in_position());
  EXPECT_EQ(lp.wallet().ref, 1e-13);
  EXPECT_EQ(m.pool.reserve(Asset::Ref), 20940.0);
}

TEST(LiquidityProvider, ExitsWhenReturnFallsBelowThreshold) {
  Market m(3.14, constant_path(10, 1500.0));
  agents::LiquidityProvider<double> lp(0, 300.0, 1.5e9, 100.0);
  auto ctx = m.ctx();
  lp.decide_and_act(ctx);
  ASSERT_TRUE(lp.in_position());

  ctx.rewards.per_day = 0.0;
  lp.decide_and_act(ctx);
  EXPECT_FALSE(lp.in_position());
  EXPECT_LT(lp.diagnostics().expected_return, 100.0);
  EXPECT_EQ(lp.diagnostics().exits, 1u);
}

TEST(Shorter, OpensWhenMarketTradesAboveRedemption) {
  Market m(2.5, constant_path(10, 1500.0));
  agents::Shorter<double> sh(1, 300.0, 5.0, 10.0, 200.0);
  auto ctx = m.ctx();
  EXPECT_GT(agents::Shorter<double>::premium_pct(ctx), 5.0);

  sh.decide_and_act(ctx);
  ASSERT_TRUE(sh.in_position());
  EXPECT_EQ(m.safes.open_safes(), 1u);
  const auto& safe = m.safes.get(sh.position().safe_id);
  EXPECT_DOUBLE_EQ(safe.collateral, 300.0);
  EXPECT_NEAR(safe.debt, 90000.0, 1e-6);
  EXPECT_NEAR(m.pool.reserve(Asset::Stable), 10090000.0, 1e-6);
  EXPECT_GT(sh.wallet().ref, 180.0);
  EXPECT_DOUBLE_EQ(sh.position().target_price, 2.5);
}

TEST(Shorter, IgnoresSmallPremium) {
  Market m(3.14, constant_path(10, 1500.0));
  agents::Shorter<double> sh(1, 300.0, 5.0, 10.0, 200.0);
  auto ctx = m.ctx();
  sh.decide_and_act(ctx);
  EXPECT_FALSE(sh.in_position());
  EXPECT_EQ(m.safes.open_safes(), 0u);
}

TEST(Shorter, StopLossClosesPosition) {
  Market m(2.5, constant_path(10, 1500.0));
  agents::Shorter<double> sh(1, 300.0, 5.0, 10.0, 200.0);
  auto ctx = m.ctx();
  sh.decide_and_act(ctx);
  ASSERT_TRUE(sh.in_position());

  // Someone buys the stablecoin up: buy-back cost rises
  m.pool.swap(Asset::Ref, 5000.0);
  sh.decide_and_act(ctx);
  EXPECT_FALSE(sh.in_position());
  EXPECT_EQ(m.safes.open_safes(), 0u);
  EXPECT_NEAR(sh.wallet().ref, 198.5, 0.5);
  EXPECT_EQ(sh.diagnostics().external_funding, 0.0);
}

TEST(Shorter, TakesProfitOnlyAfterSustainedPositiveRate) {
  Market m(2.5, constant_path(10, 1500.0));
  agents::Shorter<double> sh(1, 300.0, 5.0, 10.0, 200.0, 96);
  auto ctx = m.ctx();
  sh.decide_and_act(ctx);
  ASSERT_TRUE(sh.in_position());

  // Market falls below the take-profit target
  m.pool.swap(Asset::Stable, 3e6);
  ASSERT_LT(m.pool.spot_price() * 1500.0, 2.5);

  m.rates.assign(95, 1e-5);
  sh.decide_and_act(ctx);
  EXPECT_TRUE(sh.in_position());

  m.rates.push_back(1e-5);
  sh.decide_and_act(ctx);
  EXPECT_FALSE(sh.in_position());
  EXPECT_GT(sh.wallet().ref, 300.0);
}

TEST(Shorter, ShortfallIsToppedUpExternally) {
  Market m(2.5, constant_path(10, 1500.0));
  agents::Shorter<double> sh(1, 300.0, 5.0, 10.0, 200.0);
  auto ctx = m.ctx();
  sh.decide_and_act(ctx);
  ASSERT_TRUE(sh.in_position());

  m.pool.swap(Asset::Ref, 1e5);
  EXPECT_LT(agents::position_equity(ctx, sh.wallet(), sh.position()), 0.0);
  sh.decide_and_act(ctx);
  EXPECT_FALSE(sh.in_position());
  EXPECT_GT(sh.diagnostics().external_funding, 6000.0);
  EXPECT_NEAR(sh.wallet().ref, 0.0, 1e-6);
}

TEST(TrendLong, WaitsForRisingWeeksThenLeversToTarget) {
  Market m(3.14, peak_path());
  agents::TrendLong<double> tl(2, 300.0, 2, 2, 10.0, 300.0);

  for (uint64_t s = 0; s < 336; ++s) {
    auto ctx = m.ctx(s);
    tl.decide_and_act(ctx);
    ASSERT_FALSE(tl.in_position()) << "step " << s;
  }
  auto ctx = m.ctx(336);
  tl.decide_and_act(ctx);
  ASSERT_TRUE(tl.in_position());
  EXPECT_EQ(tl.wallet().ref, 0.0);
  const double cr = m.safes.collateralization_pct(tl.position().safe_id, m.oracle.price_at(336), 3.14);
  EXPECT_NEAR(cr, 300.0, 1e-6);
}

TEST(TrendLong, MintIsCappedByMinimumCollateralization) {
  Market m(3.14, peak_path());
  agents::TrendLong<double> tl(2, 300.0, 2, 2, 10.0, 200.0);
  auto ctx = m.ctx(336);
  const double debt = tl.size_debt(ctx, 300.0);
  const double d_max = protocol::SafeEngine<double>::max_debt(
      300.0, agents::MINT_COLLATERALIZATION_PCT, m.oracle.price_at(336), 3.14);
  EXPECT_DOUBLE_EQ(debt, d_max);
}

TEST(TrendLong, LongDoubleSizingHitsTargetAtFullPrecision) {
  if (std::numeric_limits<long double>::digits <= std::numeric_limits<double>::digits) {
    GTEST_SKIP() << "long double is no wider than double here";
  }
  using LD = long double;
  pools::LiquidityPool<LD> pool(10000000.0L, 20940.0L);
  protocol::SafeEngine<LD> safes{};
  protocol::ControllerParams<LD> cp{};
  cp.initial_redemption_price = 3.14L;
  protocol::Controller<LD> controller(cp);
  const auto path = peak_path();
  oracle::PriceOracle<LD> oracle(path, path.size());
  std::vector<LD> rates;
  agents::MarketContext<LD> ctx{pool, safes, controller, oracle, rates,
                                agents::RewardParams<LD>{}, 336, oracle.price_at(336)};

  agents::TrendLong<LD> tl(2, 300.0L, 2, 2, 10.0L, 300.0L);
  const LD debt = tl.size_debt(ctx, 300.0L);
  const LD proceeds = pool.quote_swap(Asset::Stable, debt);
  const LD cr = protocol::SafeEngine<LD>::collateralization_of(300.0L + proceeds, debt, ctx.ref_price, 3.14L);
  EXPECT_NEAR(static_cast<double>(cr - 300.0L), 0.0, 1e-14);
}

TEST(TrendLong, ClosesOnFallingWeeks) {
  Market m(3.14, peak_path());
  agents::TrendLong<double> tl(2, 300.0, 2, 2, 10.0, 300.0);

  uint64_t closed_at = 0;
  for (uint64_t s = 0; s < 1200 && closed_at == 0; ++s) {
    auto ctx = m.ctx(s);
    const bool was_open = tl.in_position();
    tl.decide_and_act(ctx);
    if (was_open && !tl.in_position()) closed_at = s;
  }
  EXPECT_EQ(closed_at, 949u);
  EXPECT_EQ(m.safes.open_safes(), 0u);
  EXPECT_GT(tl.wallet().ref, 280.0);
  EXPECT_EQ(tl.diagnostics().exits, 1u);
}

TEST(TrendLong, StopLossClosesPosition) {
  Market m(3.14, peak_path());
  agents::TrendLong<double> tl(2, 300.0, 2, 2, 10.0, 300.0);
  auto open_ctx = m.ctx(336);
  tl.decide_and_act(open_ctx);
  ASSERT_TRUE(tl.in_position());

  // Stablecoin bid up in the pool: buying back the debt costs ~19% of the stake
  m.pool.swap(Asset::Ref, 3000.0);
  auto ctx = m.ctx(337);
  ASSERT_GT(m.safes.collateralization_pct(tl.position().safe_id, m.oracle.price_at(337), 3.14), 150.0);
  ASSERT_GT(agents::position_equity(ctx, tl.wallet(), tl.position()), 0.0);

  tl.decide_and_act(ctx);
  EXPECT_FALSE(tl.in_position());
  EXPECT_EQ(m.safes.open_safes(), 0u);
  EXPECT_NEAR(tl.wallet().ref, 241.9, 0.5);
  EXPECT_EQ(tl.diagnostics().external_funding, 0.0);
  EXPECT_EQ(tl.diagnostics().exits, 1u);
}

TEST(TrendLong, GuardClosesBelowLiquidationGuard) {
  // One-hour crash after the entry; the weekly trend is still rising
  auto path = peak_path();
  path[337] = 800.0;
  Market m(3.14, path);
  agents::TrendLong<double> tl(2, 300.0, 2, 2, 10.0, 300.0, 150.0);
  auto open_ctx = m.ctx(336);
  tl.decide_and_act(open_ctx);
  ASSERT_TRUE(tl.in_position());

  auto ctx = m.ctx(337);
  EXPECT_FALSE(agents::weekly_run(m.oracle, 337, 2, false));
  EXPECT_LT(m.safes.collateralization_pct(tl.position().safe_id, 800.0, 3.14), 150.0);
  EXPECT_NEAR(agents::position_equity(ctx, tl.wallet(), tl.position()), 300.0, 1e-6);

  tl.decide_and_act(ctx);
  EXPECT_FALSE(tl.in_position());
  EXPECT_EQ(m.safes.open_safes(), 0u);
  EXPECT_NEAR(tl.wallet().ref, 300.0, 1e-6);
  EXPECT_EQ(tl.diagnostics().external_funding, 0.0);
}
