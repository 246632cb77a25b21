// Helper utilities for the constant-product pool
#pragma once

#include <cmath>

#include "core/errors.hpp"
#include "pools/constant_product.hpp"

namespace stablesim {
namespace pools {

// -----------------------------------------------------------------------------
// Entire-wallet sizing
// -----------------------------------------------------------------------------

// Reference asset to swap first so that depositing the stablecoin received
// plus the remainder of the wallet uses the whole wallet w:
//   size = R_ref * (sqrt(1 + w / R_ref) - 1)
template <typename T>
inline T entire_wallet_swap_size(T wallet_ref, T reserve_ref) {
    if (!(wallet_ref > T(0))) {
        throw InvalidAmount("wallet must be positive to size a deposit");
    }
    if (!(reserve_ref > T(0))) {
        throw PoolDepleted("reference reserve is not positive");
    }
    return reserve_ref * (std::sqrt(T(1) + wallet_ref / reserve_ref) - T(1));
}

// Outcome of swap-then-deposit with a whole reference-asset wallet
template <typename T>
struct SwapDepositQuote {
    T swap_size{0};          // reference asset swapped to stablecoin
    T stable_received{0};
    T ref_deposited{0};
    T shares{0};
    T total_supply_after{0};
};

// Simulate swap-then-deposit on a scratch copy (no state change)
template <typename T>
inline SwapDepositQuote<T> quote_swap_then_deposit(const LiquidityPool<T>& pool, T wallet_ref) {
    LiquidityPool<T> scratch = pool;
    SwapDepositQuote<T> q{};
    q.swap_size = entire_wallet_swap_size(wallet_ref, scratch.reserve(Asset::Ref));
    q.stable_received = scratch.swap(Asset::Ref, q.swap_size);
    const auto d = scratch.add_liquidity(Asset::Stable, q.stable_received);
    q.ref_deposited = d.amount_ref;
    q.shares = d.shares;
    q.total_supply_after = scratch.total_supply;
    return q;
}

// -----------------------------------------------------------------------------
// Valuation
// -----------------------------------------------------------------------------

// Fiat value of one stablecoin at the pool spot price
template <typename T>
inline T market_price_fiat(const LiquidityPool<T>& pool, T ref_price_fiat) {
    return pool.spot_price() * ref_price_fiat;
}

// Fiat value of a share balance (both sides at spot)
template <typename T>
inline T share_value_fiat(const LiquidityPool<T>& pool, T shares, T ref_price_fiat) {
    return pool.total_value_in_ref() * pool.pool_share(shares) * ref_price_fiat;
}

// Reference asset needed to buy back exactly `debt` stablecoin from the pool
template <typename T>
inline T ref_cost_of_stable(const LiquidityPool<T>& pool, T debt) {
    return pool.quote_input_for_output(Asset::Stable, debt);
}

} // namespace pools
} // namespace stablesim
