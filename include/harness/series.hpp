// Append-only run history (column layout, one entry per step)
#pragma once

#include <cstdint>
#include <vector>

#include "agents/agent.hpp"

namespace stablesim {
namespace harness {

template <typename T>
struct RunSeries {
    std::vector<uint64_t> step;
    std::vector<T> ref_price;          // oracle, fiat per reference asset
    std::vector<T> spot_price;         // reference asset per stablecoin
    std::vector<T> market_price;       // fiat per stablecoin
    std::vector<T> twap;               // fiat
    std::vector<T> redemption_price;
    std::vector<T> redemption_rate;

    void reserve(size_t n) {
        step.reserve(n);
        ref_price.reserve(n);
        spot_price.reserve(n);
        market_price.reserve(n);
        twap.reserve(n);
        redemption_price.reserve(n);
        redemption_rate.reserve(n);
    }

    void push(uint64_t s, T ref, T spot, T market, T twap_fiat, T rp, T rate) {
        step.push_back(s);
        ref_price.push_back(ref);
        spot_price.push_back(spot);
        market_price.push_back(market);
        twap.push_back(twap_fiat);
        redemption_price.push_back(rp);
        redemption_rate.push_back(rate);
    }

    size_t size() const { return step.size(); }
};

// Per-agent diagnostics over the requested step window
template <typename T>
struct AgentSeries {
    uint64_t id{0};
    agents::AgentKind kind{agents::AgentKind::LiquidityProvider};
    std::vector<uint64_t> step;
    std::vector<T> expected_return;
    std::vector<T> pool_share;
    std::vector<T> equity;
    std::vector<bool> in_position;

    void push(uint64_t s, const agents::Agent<T>& a) {
        const auto& d = a.diagnostics();
        step.push_back(s);
        expected_return.push_back(d.expected_return);
        pool_share.push_back(d.pool_share);
        equity.push_back(d.equity);
        in_position.push_back(a.in_position());
    }
};

} // namespace harness
} // namespace stablesim
