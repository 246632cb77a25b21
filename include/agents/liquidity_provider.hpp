// Buy-and-sell liquidity provider: enters with its whole wallet when the
// expected return clears its threshold, exits completely when it does not
#pragma once

#include <cstdint>
#include <string>

#include "agents/agent.hpp"
#include "agents/returns.hpp"
#include "core/common.hpp"
#include "core/numeric_types.hpp"
#include "core/random.hpp"
#include "pools/helpers.hpp"

namespace stablesim {
namespace agents {

// Ranges the per-agent parameters are drawn from
template <typename T>
struct LiquidityProviderParams {
    Range<T> holdings{T(100), T(500)};          // reference asset
    Range<T> valuation{T(1e9), T(2e9)};         // reward token, fiat
    Range<T> return_threshold{T(200), T(300)};  // percent
};

template <typename T>
class LiquidityProvider : public Agent<T> {
public:
    LiquidityProvider(uint64_t id, T holdings, T valuation, T return_threshold)
        : Agent<T>(id, holdings), valuation_(valuation), threshold_(return_threshold) {}

    static LiquidityProvider draw(uint64_t id, const LiquidityProviderParams<T>& p, Rng& rng) {
        const T holdings = draw_uniform(rng, p.holdings);
        const T valuation = draw_uniform(rng, p.valuation);
        const T threshold = draw_uniform(rng, p.return_threshold);
        return LiquidityProvider(id, holdings, valuation, threshold);
    }

    AgentKind kind() const override { return AgentKind::LiquidityProvider; }
    bool in_position() const override { return this->wallet_.shares > T(0); }

    T valuation() const { return valuation_; }
    T return_threshold() const { return threshold_; }

    // Expected annual return in percent for the current or prospective share
    T evaluate(const MarketContext<T>& ctx) {
        const auto& pool = ctx.pool;
        ReturnSnapshot<T> s{};
        if (in_position()) {
            s.pool_share = pool.pool_share(this->wallet_.shares);
        } else {
            const auto q = pools::quote_swap_then_deposit(pool, this->wallet_.ref);
            s.pool_share = q.shares / q.total_supply_after;
        }
        s.share_value = pool.total_value_in_ref() * s.pool_share * ctx.ref_price;
        s.valuation = valuation_;
        s.reward_total_supply = ctx.rewards.total_supply;
        s.reward_per_day = ctx.rewards.per_day;
        s.redemption_rate = ctx.controller.redemption_rate();
        s.forward_redemption_price = ctx.controller.forward_redemption_price(HOURS_PER_YEAR);
        s.market_price = pools::market_price_fiat(pool, ctx.ref_price);
        this->diag_.pool_share = s.pool_share;
        return expected_return_pct(s);
    }

    void decide_and_act(MarketContext<T>& ctx) override {
        if (!in_position() && !can_enter(ctx.pool)) {
            this->diag_.pool_share = T(0);
            return;
        }
        const T ret = evaluate(ctx);
        this->diag_.expected_return = ret;

        if (ret >= threshold_ && !in_position()) {
            enter(ctx);
        } else if (ret < threshold_ && in_position()) {
            exit(ctx);
        }
    }

    // Swap the entire-wallet size to stablecoin, then deposit everything
    void enter(MarketContext<T>& ctx) {
        auto& pool = ctx.pool;
        const T wallet = this->wallet_.ref;
        // Fails before any mutation if the pool cannot take the deposit
        pools::quote_swap_then_deposit(pool, wallet);

        const T size = pools::entire_wallet_swap_size(wallet, pool.reserve(pools::Asset::Ref));
        const T stable = pool.swap(pools::Asset::Ref, size);
        const auto d = pool.add_liquidity(pools::Asset::Stable, stable);

        if (!approx_equal(size + d.amount_ref, wallet)) {
            throw InvalidAmount("deposit left " + std::to_string(static_cast<double>(wallet - size - d.amount_ref)) +
                                " reference asset unaccounted");
        }
        this->wallet_.ref = T(0);
        this->wallet_.shares += d.shares;
        ++this->diag_.entries;
        this->trace(ctx, "lp_enter", wallet);
    }

    // Burn every share and swap the stablecoin leg back to reference asset
    void exit(MarketContext<T>& ctx) {
        auto& pool = ctx.pool;
        const T shares = this->wallet_.shares;
        const auto d = pool.remove_liquidity(shares, shares);
        const T ref_out = pool.swap(pools::Asset::Stable, d.amount_stable);

        this->wallet_.ref += d.amount_ref + ref_out;
        this->wallet_.shares = T(0);
        ++this->diag_.exits;
        this->trace(ctx, "lp_exit", this->wallet_.ref);
    }

private:
    // A dust wallet whose swap rounds to nothing cannot be deposited
    bool can_enter(const pools::LiquidityPool<T>& pool) const {
        if (!(this->wallet_.ref > T(0))) return false;
        const T size = pools::entire_wallet_swap_size(this->wallet_.ref, pool.reserve(pools::Asset::Ref));
        return size > T(0) && pool.quote_swap(pools::Asset::Ref, size) > T(0);
    }

    T valuation_;
    T threshold_;
};

} // namespace agents
} // namespace stablesim
