// Shorter: mints stablecoin against its wallet when the market trades above
// the redemption price, sells it, and buys the debt back later
#pragma once

#include <cstdint>

#include "agents/agent.hpp"
#include "agents/position.hpp"
#include "core/random.hpp"
#include "pools/helpers.hpp"
#include "protocol/safe_engine.hpp"

namespace stablesim {
namespace agents {

template <typename T>
struct ShorterParams {
    Range<T> holdings{T(300), T(500)};
    Range<T> difference_threshold{T(3), T(8)};   // percent above redemption
    Range<T> stop_loss{T(10), T(50)};            // percent
    Range<T> collateralization{T(150), T(300)};  // percent
    uint64_t take_profit_lookback{96};           // steps of positive rate before taking profit
};

template <typename T>
class Shorter : public Agent<T> {
public:
    Shorter(uint64_t id, T holdings, T difference_threshold, T stop_loss, T collateralization,
            uint64_t take_profit_lookback = 96)
        : Agent<T>(id, holdings),
          threshold_(difference_threshold),
          stop_loss_(stop_loss),
          collateralization_(collateralization),
          lookback_(take_profit_lookback) {}

    static Shorter draw(uint64_t id, const ShorterParams<T>& p, Rng& rng) {
        const T holdings = draw_uniform(rng, p.holdings);
        const T threshold = draw_uniform(rng, p.difference_threshold);
        const T stop_loss = draw_uniform(rng, p.stop_loss);
        const T cr = draw_uniform(rng, p.collateralization);
        return Shorter(id, holdings, threshold, stop_loss, cr, p.take_profit_lookback);
    }

    AgentKind kind() const override { return AgentKind::Shorter; }
    bool in_position() const override { return position_.open; }
    const Position<T>& position() const { return position_; }

    // Percent by which the market trades above the redemption price
    static T premium_pct(const MarketContext<T>& ctx) {
        const T redemption_in_ref = ctx.controller.redemption_price() / ctx.ref_price;
        return T(100) * (T(1) - redemption_in_ref / ctx.pool.spot_price());
    }

    void decide_and_act(MarketContext<T>& ctx) override {
        if (position_.open) {
            manage(ctx);
            return;
        }
        if (this->wallet_.ref > T(0) && premium_pct(ctx) > threshold_) {
            open(ctx);
        }
    }

private:
    void open(MarketContext<T>& ctx) {
        const T collateral = this->wallet_.ref;
        const T rp = ctx.controller.redemption_price();
        const T debt = protocol::SafeEngine<T>::max_debt(collateral, collateralization_, ctx.ref_price, rp);
        ctx.pool.quote_swap(pools::Asset::Stable, debt);

        const auto opened = ctx.safes.open(this->id_, collateral, collateralization_, ctx.ref_price, rp);
        const T ref_out = ctx.pool.swap(pools::Asset::Stable, opened.second);

        this->wallet_.ref = ref_out;
        position_.open = true;
        position_.safe_id = opened.first;
        position_.net_worth_before = collateral;
        position_.target_price = rp;
        position_.opened_at = ctx.step;
        ++this->diag_.entries;
        this->trace(ctx, "short_open", opened.second);
    }

    // Close on non-positive equity, then stop loss, then take profit
    void manage(MarketContext<T>& ctx) {
        const T equity = position_equity(ctx, this->wallet_, position_);
        this->diag_.equity = equity;

        bool close = false;
        if (!(equity > T(0))) {
            close = true;
        } else if (unrealized_loss_pct(equity, position_.net_worth_before) > stop_loss_) {
            close = true;
        } else if (pools::market_price_fiat(ctx.pool, ctx.ref_price) < position_.target_price &&
                   rate_positive_for(ctx.rate_history, lookback_)) {
            close = true;
        }
        if (close) {
            close_position(ctx, this->wallet_, position_, this->diag_);
            this->trace(ctx, "short_close", this->wallet_.ref);
        }
    }

    T threshold_;
    T stop_loss_;
    T collateralization_;
    uint64_t lookback_;
    Position<T> position_{};
};

} // namespace agents
} // namespace stablesim
