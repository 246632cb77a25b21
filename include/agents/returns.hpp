// Expected-return math for liquidity providers (free functions over snapshots)
#pragma once

#include <cmath>

#include "core/common.hpp"
#include "core/errors.hpp"

namespace stablesim {
namespace agents {

// Inputs for one expected-return evaluation, all in fiat unless noted
template <typename T>
struct ReturnSnapshot {
    T pool_share{0};               // current share, or share after a hypothetical deposit
    T share_value{0};              // fiat value of that share
    T valuation{0};                // believed valuation of the reward token
    T reward_total_supply{0};
    T reward_per_day{0};           // emission to all liquidity providers
    T redemption_rate{0};          // per step, proportional
    T forward_redemption_price{0}; // one year ahead at the current rate
    T market_price{0};             // stablecoin in fiat
};

// Annualized reward yield in percent:
//   100 * (P_flx * D_flx * share * 365 / V_share - 1)
template <typename T>
inline T reward_yield_pct(const ReturnSnapshot<T>& s) {
    if (!(s.share_value > T(0))) {
        throw InvalidAmount("share value must be positive to price rewards");
    }
    const T token_price = s.valuation / s.reward_total_supply;
    const T yearly = token_price * s.reward_per_day * s.pool_share * T(DAYS_PER_YEAR);
    return T(100) * (yearly / s.share_value - T(1));
}

// Gain (positive rate) or cost (otherwise) of holding the stablecoin while
// the redemption price converges over a year
template <typename T>
inline T convergence_pct(const ReturnSnapshot<T>& s) {
    const T gap = T(100) * std::abs(T(1) - s.forward_redemption_price / s.market_price);
    return s.redemption_rate > T(0) ? gap : -gap;
}

template <typename T>
inline T expected_return_pct(const ReturnSnapshot<T>& s) {
    return require_finite(reward_yield_pct(s) + convergence_pct(s), "expected return");
}

} // namespace agents
} // namespace stablesim
