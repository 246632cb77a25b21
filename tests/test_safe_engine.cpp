#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "protocol/safe_engine.hpp"

using Engine = stablesim::protocol::SafeEngine<double>;

TEST(SafeEngine, OpenMintsDebtAtRequestedCollateralization) {
  Engine e;
  const auto opened = e.open(7, 10.0, 200.0, 1500.0, 3.14);
  EXPECT_DOUBLE_EQ(opened.second, 10.0 * 1500.0 / 2.0 / 3.14);
  EXPECT_NEAR(e.collateralization_pct(opened.first, 1500.0, 3.14), 200.0, 1e-9);
  EXPECT_EQ(e.get(opened.first).owner, 7u);
  EXPECT_EQ(e.open_safes(), 1u);
  EXPECT_DOUBLE_EQ(e.total_collateral(), 10.0);
}

TEST(SafeEngine, RejectsMintAtOrBelowMinimum) {
  Engine e;
  EXPECT_THROW(e.open(1, 10.0, 145.0, 1500.0, 3.14), stablesim::InvalidAmount);
  EXPECT_THROW(e.open(1, 0.0, 200.0, 1500.0, 3.14), stablesim::InvalidAmount);
  EXPECT_EQ(e.open_safes(), 0u);
}

TEST(SafeEngine, ModifyKeepsMinimumCollateralization) {
  Engine e;
  const auto opened = e.open(1, 10.0, 200.0, 1500.0, 3.14);
  e.modify(opened.first, 5.0, 0.0, 1500.0, 3.14);
  EXPECT_NEAR(e.collateralization_pct(opened.first, 1500.0, 3.14), 300.0, 1e-9);
  EXPECT_THROW(e.modify(opened.first, 0.0, opened.second * 2.0, 1500.0, 3.14), stablesim::InvalidAmount);
  EXPECT_THROW(e.modify(opened.first, -20.0, 0.0, 1500.0, 3.14), stablesim::InvalidAmount);
}

TEST(SafeEngine, CloseReturnsCollateral) {
  Engine e;
  const auto opened = e.open(1, 10.0, 200.0, 1500.0, 3.14);
  EXPECT_DOUBLE_EQ(e.close(opened.first), 10.0);
  EXPECT_EQ(e.open_safes(), 0u);
  EXPECT_DOUBLE_EQ(e.total_debt(), 0.0);
  EXPECT_THROW(e.get(opened.first), stablesim::InvalidAmount);
  EXPECT_THROW(e.close(opened.first), stablesim::InvalidAmount);
}

TEST(SafeEngine, RollbackRestoresCheckpoint) {
  Engine e;
  const auto kept = e.open(1, 10.0, 200.0, 1500.0, 3.14);

  e.checkpoint();
  const auto fresh = e.open(2, 4.0, 250.0, 1500.0, 3.14);
  e.modify(kept.first, 1.0, 0.0, 1500.0, 3.14);
  e.close(kept.first);
  e.rollback();

  EXPECT_EQ(e.open_safes(), 1u);
  EXPECT_DOUBLE_EQ(e.get(kept.first).collateral, 10.0);
  EXPECT_THROW(e.get(fresh.first), stablesim::InvalidAmount);
  EXPECT_DOUBLE_EQ(e.total_collateral(), 10.0);
  EXPECT_DOUBLE_EQ(e.total_debt(), kept.second);

  const auto reopened = e.open(3, 1.0, 200.0, 1500.0, 3.14);
  EXPECT_EQ(reopened.first, fresh.first);
}
