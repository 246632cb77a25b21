#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "core/common.hpp"
#include "core/errors.hpp"
#include "protocol/controller.hpp"

using namespace stablesim::protocol;

namespace {

ControllerParams<double> every_step(double kp, double ki = 0.0, double kd = 0.0) {
  ControllerParams<double> p{};
  p.kp = kp;
  p.ki = ki;
  p.kd = kd;
  p.update_period = 1;
  p.warmup_steps = 0;
  p.initial_redemption_price = 3.14;
  return p;
}

} // namespace

TEST(Controller, ModeFollowsGains) {
  EXPECT_EQ(every_step(1e-4).mode(), ControllerMode::P);
  EXPECT_EQ(every_step(1e-4, 1e-6).mode(), ControllerMode::PI);
  EXPECT_EQ(every_step(1e-4, 0.0, 1e-3).mode(), ControllerMode::PID);
}

TEST(Controller, PureProportionalRateIsGainTimesError) {
  Controller<double> c(every_step(0.00023));
  EXPECT_TRUE(c.step(0, 3.0));
  EXPECT_DOUBLE_EQ(c.redemption_price(), 3.14);
  EXPECT_DOUBLE_EQ(c.redemption_rate(), 0.00023 * (3.14 - 3.0));
  EXPECT_DOUBLE_EQ(c.integral(), 0.0);
}

TEST(Controller, MarketBelowTargetRaisesRedemptionPrice) {
  Controller<double> c(every_step(0.00023));
  c.step(0, 3.0);
  EXPECT_GT(c.redemption_rate(), 0.0);
  c.step(1, 3.0);
  EXPECT_GT(c.redemption_price(), 3.14);

  Controller<double> d(every_step(0.00023));
  d.step(0, 3.5);
  EXPECT_LT(d.redemption_rate(), 0.0);
  d.step(1, 3.5);
  EXPECT_LT(d.redemption_price(), 3.14);
}

TEST(Controller, HoldsRateBetweenUpdatesAndCompoundsEveryStep) {
  ControllerParams<double> p{};
  p.kp = 1e-4;
  p.update_period = 4;
  p.warmup_steps = 3;
  p.initial_redemption_price = 3.14;
  Controller<double> c(p);

  for (uint64_t s = 0; s < 4; ++s) {
    EXPECT_FALSE(c.step(s, 3.0));
    EXPECT_DOUBLE_EQ(c.redemption_rate(), 0.0);
  }
  EXPECT_TRUE(c.step(4, 3.0));
  const double rate = c.redemption_rate();
  EXPECT_DOUBLE_EQ(rate, 1e-4 * (3.14 - 3.0));

  const double rp4 = c.redemption_price();
  EXPECT_FALSE(c.step(5, 2.0));
  EXPECT_DOUBLE_EQ(c.redemption_rate(), rate);
  EXPECT_DOUBLE_EQ(c.redemption_price(), rp4 * (1.0 + rate));
  EXPECT_EQ(c.updates(), 1u);
}

TEST(Controller, PidAccumulatesIntegralAndDerivative) {
  const double kp = 1e-3, ki = 1e-4, kd = 1e-2;
  Controller<double> c(every_step(kp, ki, kd));

  c.step(0, 3.0);
  const double e0 = 3.14 - 3.0;
  double integral = ki * e0;
  EXPECT_NEAR(c.redemption_rate(), kp * e0 + integral, 1e-15);

  c.step(1, 3.1);
  const double rp1 = 3.14 * (1.0 + kp * e0 + ki * e0);
  const double e1 = rp1 - 3.1;
  integral += ki * e1;
  EXPECT_NEAR(c.redemption_price(), rp1, 1e-14);
  EXPECT_NEAR(c.integral(), integral, 1e-15);
  EXPECT_NEAR(c.redemption_rate(), kp * e1 + integral + kd * (e1 - e0), 1e-14);
  EXPECT_NEAR(c.last_error(), e1, 1e-14);
}

TEST(Controller, ForwardRedemptionPriceCompoundsOneYear) {
  Controller<double> c(every_step(0.00023));
  c.step(0, 3.0);
  const double expected = 3.14 * std::pow(1.0 + c.redemption_rate(), 8760.0);
  EXPECT_NEAR(c.forward_redemption_price(stablesim::HOURS_PER_YEAR), expected, 1e-12 * expected);
}

TEST(Controller, NonFiniteInputDiverges) {
  Controller<double> c(every_step(0.00023));
  EXPECT_THROW(c.step(0, std::numeric_limits<double>::quiet_NaN()), stablesim::NumericDivergence);
}

TEST(Controller, NegativeRedemptionPriceDiverges) {
  Controller<double> c(every_step(1.0));
  c.step(0, 1000.0);
  ASSERT_LT(c.redemption_rate(), -1.0);
  EXPECT_THROW(c.step(1, 1000.0), stablesim::NumericDivergence);
}

TEST(Controller, RejectsInvalidParameters) {
  auto p = every_step(1e-4);
  p.initial_redemption_price = 0.0;
  EXPECT_THROW(Controller<double>{p}, stablesim::InvalidConfiguration);
  p = every_step(1e-4);
  p.update_period = 0;
  EXPECT_THROW(Controller<double>{p}, stablesim::InvalidConfiguration);
}
