// Constant-product (x*y=k) liquidity pool pairing the stablecoin with the reference asset
// Zero-fee variant: swaps preserve k, liquidity operations scale it
#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "core/errors.hpp"

namespace stablesim {
namespace pools {

enum class Asset : size_t { Stable = 0, Ref = 1 };

inline constexpr size_t idx(Asset a) { return static_cast<size_t>(a); }
inline constexpr Asset other(Asset a) { return a == Asset::Stable ? Asset::Ref : Asset::Stable; }

inline const char* to_string(Asset a) { return a == Asset::Stable ? "stable" : "ref"; }

// Amounts moved by one liquidity operation
template <typename T>
struct LiquidityDelta {
    T amount_stable{0};
    T amount_ref{0};
    T shares{0};
};

template <typename T>
class LiquidityPool {
public:
    // State variables
    std::array<T, 2> reserves{T(0), T(0)};   // [stable, ref]
    T total_supply{0};                       // L_total
    T seed_shares{0};                        // minted at creation, never burned

    LiquidityPool(T initial_stable, T initial_ref) {
        if (!(initial_stable > T(0)) || !(initial_ref > T(0)) ||
            !std::isfinite(static_cast<long double>(initial_stable)) ||
            !std::isfinite(static_cast<long double>(initial_ref))) {
            throw InvalidConfiguration("initial pool reserves must be positive and finite");
        }
        reserves = {initial_stable, initial_ref};
        // Uniswap v2 convention for the first mint
        total_supply = std::sqrt(initial_stable * initial_ref);
        seed_shares = total_supply;
    }

    T reserve(Asset a) const { return reserves[idx(a)]; }

    T invariant() const { return reserves[0] * reserves[1]; }

    // Price of one stablecoin in reference-asset units (R_ref / R_stable)
    T spot_price() const {
        ensure_live();
        return reserves[1] / reserves[0];
    }

    // Stablecoin per unit of reference asset (R_stable / R_ref)
    T stable_per_ref() const {
        ensure_live();
        return reserves[0] / reserves[1];
    }

    T pool_share(T shares) const {
        ensure_live();
        return shares / total_supply;
    }

    // Both sides valued in reference asset at the spot price
    T total_value_in_ref() const {
        ensure_live();
        return reserves[0] * spot_price() + reserves[1];
    }

    // ------------------------------------------------------------------------
    // Quotes (no state change)
    // ------------------------------------------------------------------------

    T quote_swap(Asset asset_in, T amount_in) const {
        ensure_live();
        check_amount(amount_in, "swap amount");
        const T r_in = reserves[idx(asset_in)];
        const T r_out = reserves[idx(other(asset_in))];
        const T new_out = invariant() / (r_in + amount_in);
        if (!(new_out > T(0)) || !std::isfinite(static_cast<long double>(new_out))) {
            throw PoolDepleted(std::string("swap would exhaust the ") + to_string(other(asset_in)) + " reserve");
        }
        return r_out - new_out;
    }

    // Input of the other asset needed to take exactly amount_out of asset_out
    T quote_input_for_output(Asset asset_out, T amount_out) const {
        ensure_live();
        check_amount(amount_out, "output amount");
        const T r_out = reserves[idx(asset_out)];
        const T r_in = reserves[idx(other(asset_out))];
        if (!(amount_out < r_out)) {
            throw PoolDepleted(std::string("requested output exceeds the ") + to_string(asset_out) + " reserve");
        }
        return r_in * (r_out / (r_out - amount_out) - T(1));
    }

    LiquidityDelta<T> quote_add_liquidity(Asset side, T amount) const {
        ensure_live();
        check_amount(amount, "deposit amount");
        const T r_side = reserves[idx(side)];
        const T r_other = reserves[idx(other(side))];

        LiquidityDelta<T> d{};
        const T other_amount = amount * r_other / r_side;
        if (side == Asset::Stable) {
            d.amount_stable = amount;
            d.amount_ref = other_amount;
        } else {
            d.amount_stable = other_amount;
            d.amount_ref = amount;
        }
        d.shares = amount / r_side * total_supply;
        return d;
    }

    // ------------------------------------------------------------------------
    // Mutations
    // ------------------------------------------------------------------------

    // Swap amount_in of asset_in for the other asset; returns amount out
    T swap(Asset asset_in, T amount_in) {
        const T amount_out = quote_swap(asset_in, amount_in);
        const T k = invariant();
        reserves[idx(asset_in)] += amount_in;
        reserves[idx(other(asset_in))] = k / reserves[idx(asset_in)];
        return amount_out;
    }

    // Proportional deposit sized from one side at the current ratio
    LiquidityDelta<T> add_liquidity(Asset side, T amount) {
        const auto d = quote_add_liquidity(side, amount);
        reserves[0] += d.amount_stable;
        reserves[1] += d.amount_ref;
        total_supply += d.shares;
        return d;
    }

    // Burn shares held by a provider whose recorded balance is owner_balance
    LiquidityDelta<T> remove_liquidity(T shares, T owner_balance) {
        ensure_live();
        check_amount(shares, "shares to burn");
        if (shares > owner_balance) {
            throw InsufficientShares("burn of " + std::to_string(static_cast<double>(shares)) +
                                     " exceeds balance " + std::to_string(static_cast<double>(owner_balance)));
        }
        if (!(shares < total_supply)) {
            throw InsufficientShares("burn would reach into the seed liquidity");
        }

        const T frac = shares / total_supply;
        LiquidityDelta<T> d{};
        d.amount_stable = frac * reserves[0];
        d.amount_ref = frac * reserves[1];
        d.shares = shares;

        const T new_stable = reserves[0] - d.amount_stable;
        const T new_ref = reserves[1] - d.amount_ref;
        if (!(new_stable > T(0)) || !(new_ref > T(0))) {
            throw PoolDepleted("withdrawal would empty the pool");
        }
        reserves = {new_stable, new_ref};
        total_supply -= shares;
        return d;
    }

private:
    void ensure_live() const {
        if (!(reserves[0] > T(0)) || !(reserves[1] > T(0))) {
            throw PoolDepleted("pool reserves are not positive");
        }
    }

    static void check_amount(T amount, const char* what) {
        if (!(amount > T(0)) || !std::isfinite(static_cast<long double>(amount))) {
            throw InvalidAmount(std::string(what) + " must be positive and finite, got " +
                                std::to_string(static_cast<double>(amount)));
        }
    }
};

} // namespace pools
} // namespace stablesim
