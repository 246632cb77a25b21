// Trend-following long: levers its reference asset through a safe after a run
// of rising weeks, unwinds on stop loss, thin collateral or a falling run
#pragma once

#include <algorithm>
#include <cstdint>

#include "agents/agent.hpp"
#include "agents/position.hpp"
#include "core/errors.hpp"
#include "core/random.hpp"
#include "core/roots.hpp"
#include "pools/helpers.hpp"
#include "protocol/safe_engine.hpp"

namespace stablesim {
namespace agents {

// Collateralization used for the initial mint, just above the protocol minimum
constexpr double MINT_COLLATERALIZATION_PCT = protocol::MIN_COLLATERALIZATION_PCT + 0.01;

template <typename T>
struct TrendLongParams {
    Range<T> holdings{T(300), T(500)};
    Range<T> uptrend_weeks{T(1), T(10)};
    Range<T> downtrend_weeks{T(1), T(10)};
    Range<T> stop_loss{T(10), T(50)};
    Range<T> collateralization{T(200), T(300)};  // target after the leverage loop
    T liquidation_guard_pct{T(150)};
};

template <typename T>
class TrendLong : public Agent<T> {
public:
    TrendLong(uint64_t id, T holdings, int uptrend_weeks, int downtrend_weeks, T stop_loss,
              T collateralization, T liquidation_guard_pct = T(150))
        : Agent<T>(id, holdings),
          uptrend_weeks_(uptrend_weeks),
          downtrend_weeks_(downtrend_weeks),
          stop_loss_(stop_loss),
          target_cr_(collateralization),
          guard_pct_(liquidation_guard_pct) {}

    static TrendLong draw(uint64_t id, const TrendLongParams<T>& p, Rng& rng) {
        const T holdings = draw_uniform(rng, p.holdings);
        const int up = draw_count(rng, p.uptrend_weeks);
        const int down = draw_count(rng, p.downtrend_weeks);
        const T stop_loss = draw_uniform(rng, p.stop_loss);
        const T cr = draw_uniform(rng, p.collateralization);
        return TrendLong(id, holdings, up, down, stop_loss, cr, p.liquidation_guard_pct);
    }

    AgentKind kind() const override { return AgentKind::TrendLong; }
    bool in_position() const override { return position_.open; }
    const Position<T>& position() const { return position_; }
    T target_collateralization() const { return target_cr_; }

    void decide_and_act(MarketContext<T>& ctx) override {
        if (position_.open) {
            manage(ctx);
            return;
        }
        const int history_weeks = std::max(uptrend_weeks_, downtrend_weeks_);
        if (ctx.step < static_cast<uint64_t>(HOURS_PER_WEEK) * static_cast<uint64_t>(history_weeks)) return;
        if (this->wallet_.ref > T(0) && weekly_run(ctx.oracle, ctx.step, uptrend_weeks_, true)) {
            open(ctx);
        }
    }

    // Debt to mint against c0 so that selling it and re-depositing the proceeds
    // lands on the target collateralization, capped by the mint minimum
    T size_debt(const MarketContext<T>& ctx, T c0) const {
        const T P = ctx.ref_price;
        const T R = ctx.controller.redemption_price();
        const T d_max = protocol::SafeEngine<T>::max_debt(c0, T(MINT_COLLATERALIZATION_PCT), P, R);

        auto final_cr = [&](T d) {
            const T proceeds = ctx.pool.quote_swap(pools::Asset::Stable, d);
            return protocol::SafeEngine<T>::collateralization_of(c0 + proceeds, d, P, R);
        };
        if (final_cr(d_max) >= target_cr_) return d_max;

        const T lo = d_max * T(1e-9);
        const T hi = d_max;
        auto f = [&](T d) { return final_cr(d) - target_cr_; };
        T root = T(0);
        if (!toms748_root<T>(f, lo, hi, f(lo), f(hi), root)) {
            throw NumericDivergence("mint sizing failed to bracket the target collateralization");
        }
        return std::min(root, d_max);
    }

private:
    void open(MarketContext<T>& ctx) {
        const T c0 = this->wallet_.ref;
        const T P = ctx.ref_price;
        const T R = ctx.controller.redemption_price();
        const T debt = size_debt(ctx, c0);
        const T mint_cr = protocol::SafeEngine<T>::collateralization_of(c0, debt, P, R);

        const auto opened = ctx.safes.open(this->id_, c0, mint_cr, P, R);
        const T ref_out = ctx.pool.swap(pools::Asset::Stable, opened.second);
        ctx.safes.modify(opened.first, ref_out, T(0), P, R);

        this->wallet_.ref = T(0);
        position_.open = true;
        position_.safe_id = opened.first;
        position_.net_worth_before = c0;
        position_.target_price = T(0);
        position_.opened_at = ctx.step;
        ++this->diag_.entries;
        this->trace(ctx, "long_open", opened.second);
    }

    void manage(MarketContext<T>& ctx) {
        const T equity = position_equity(ctx, this->wallet_, position_);
        this->diag_.equity = equity;
        const T cr = ctx.safes.collateralization_pct(position_.safe_id, ctx.ref_price,
                                                     ctx.controller.redemption_price());

        const bool close = !(equity > T(0)) ||
                           unrealized_loss_pct(equity, position_.net_worth_before) > stop_loss_ ||
                           cr < guard_pct_ ||
                           weekly_run(ctx.oracle, ctx.step, downtrend_weeks_, false);
        if (close) {
            close_position(ctx, this->wallet_, position_, this->diag_);
            this->trace(ctx, "long_close", this->wallet_.ref);
        }
    }

    int uptrend_weeks_;
    int downtrend_weeks_;
    T stop_loss_;
    T target_cr_;
    T guard_pct_;
    Position<T> position_{};
};

} // namespace agents
} // namespace stablesim
