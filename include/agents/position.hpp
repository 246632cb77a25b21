// Safe-backed position helpers shared by shorters and trend longs
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "agents/agent.hpp"
#include "core/common.hpp"
#include "pools/helpers.hpp"

namespace stablesim {
namespace agents {

// Reference asset the position would hold after buying back its debt
template <typename T>
inline T position_equity(const MarketContext<T>& ctx, const Wallet<T>& wallet, const Position<T>& pos) {
    const auto& safe = ctx.safes.get(pos.safe_id);
    const T cost = pools::ref_cost_of_stable(ctx.pool, safe.debt);
    return wallet.ref + safe.collateral - cost;
}

// Unrealized loss in percent of the net worth held before opening
template <typename T>
inline T unrealized_loss_pct(T equity, T net_worth_before) {
    return T(100) * (T(1) - equity / net_worth_before);
}

// Buy back exactly the debt, repay, and take the collateral back. A wallet
// shortfall is bridged, then repaid from the returned collateral; whatever the
// collateral cannot repay is recorded as external funding.
template <typename T>
inline void close_position(MarketContext<T>& ctx, Wallet<T>& wallet, Position<T>& pos,
                           AgentDiagnostics<T>& diag) {
    const auto safe = ctx.safes.get(pos.safe_id);
    const T cost = pools::ref_cost_of_stable(ctx.pool, safe.debt);
    const T bridge = std::max(T(0), cost - wallet.ref);

    const T bought = ctx.pool.swap(pools::Asset::Ref, cost);
    wallet.ref = std::max(T(0), wallet.ref + bridge - cost);
    wallet.stable += std::max(T(0), bought - safe.debt);

    const T collateral = ctx.safes.close(pos.safe_id);
    const T repaid = std::min(bridge, collateral);
    wallet.ref += collateral - repaid;
    diag.external_funding += bridge - repaid;

    pos = Position<T>{};
    diag.equity = T(0);
    ++diag.exits;
}

// True when the redemption rate stayed positive over the last `lookback` steps
template <typename T>
inline bool rate_positive_for(const std::vector<T>& rate_history, uint64_t lookback) {
    if (rate_history.size() < lookback) return false;
    return std::all_of(rate_history.end() - static_cast<std::ptrdiff_t>(lookback), rate_history.end(),
                       [](T r) { return r > T(0); });
}

// True when each of the last `weeks` weekly moves of the oracle price ended
// strictly higher (rising) or strictly lower (falling) than it started
template <typename T>
inline bool weekly_run(const oracle::PriceOracle<T>& oracle, uint64_t step, int weeks, bool rising) {
    if (weeks <= 0) return false;
    const uint64_t week = HOURS_PER_WEEK;
    if (step < week * static_cast<uint64_t>(weeks)) return false;
    for (int i = 0; i < weeks; ++i) {
        const T later = oracle.price_at(step - week * static_cast<uint64_t>(i));
        const T earlier = oracle.price_at(step - week * static_cast<uint64_t>(i + 1));
        if (rising ? !(later > earlier) : !(later < earlier)) return false;
    }
    return true;
}

} // namespace agents
} // namespace stablesim
