// Agent interface: one decision/action entry point per activation
#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <vector>

#include "core/common.hpp"
#include "oracle/price_oracle.hpp"
#include "pools/constant_product.hpp"
#include "protocol/controller.hpp"
#include "protocol/safe_engine.hpp"

namespace stablesim {
namespace agents {

enum class AgentKind { LiquidityProvider, Shorter, TrendLong };

inline const char* to_string(AgentKind k) {
    switch (k) {
        case AgentKind::LiquidityProvider: return "liquidity_provider";
        case AgentKind::Shorter:           return "shorter";
        case AgentKind::TrendLong:         return "trend_long";
    }
    return "unknown";
}

template <typename T>
struct Wallet {
    T ref{0};       // reference asset
    T stable{0};    // stablecoin
    T shares{0};    // pool shares
};

// Safe-backed position held by shorters and trend longs
template <typename T>
struct Position {
    bool open{false};
    uint64_t safe_id{0};
    T net_worth_before{0};   // reference asset held before opening
    T target_price{0};       // take-profit level in fiat (shorter)
    uint64_t opened_at{0};
};

template <typename T>
struct AgentDiagnostics {
    T expected_return{0};     // percent, liquidity providers
    T pool_share{0};
    T equity{0};              // reference asset, open positions
    T external_funding{0};    // reference asset added from outside to close
    uint64_t entries{0};
    uint64_t exits{0};
};

// Reward emission to all liquidity providers
template <typename T>
struct RewardParams {
    T per_day{T(334)};
    T total_supply{T(1000000)};
};

// Everything an agent may read or mutate during its activation
template <typename T>
struct MarketContext {
    pools::LiquidityPool<T>& pool;
    protocol::SafeEngine<T>& safes;
    const protocol::Controller<T>& controller;
    const oracle::PriceOracle<T>& oracle;
    const std::vector<T>& rate_history;   // redemption rate recorded at the end of each past step
    RewardParams<T> rewards;
    uint64_t step{0};
    T ref_price{0};                       // oracle price at this step
};

template <typename T>
class Agent {
public:
    Agent(uint64_t id, T holdings) : id_(id) {
        wallet_.ref = holdings;
    }
    virtual ~Agent() = default;

    virtual AgentKind kind() const = 0;

    // Inspect the market and act on it; the only entry point that mutates state
    virtual void decide_and_act(MarketContext<T>& ctx) = 0;

    // Providing liquidity or holding a safe
    virtual bool in_position() const = 0;

    uint64_t id() const { return id_; }
    const Wallet<T>& wallet() const { return wallet_; }
    const AgentDiagnostics<T>& diagnostics() const { return diag_; }

protected:
    void trace(const MarketContext<T>& ctx, const char* action, T amount) const {
        if (!trace_sim_enabled()) return;
        std::lock_guard<std::mutex> lock(io_mu);
        std::cerr << "[TRACE_SIM] step=" << ctx.step
                  << " agent=" << id_ << " kind=" << to_string(kind())
                  << " " << action << " amount=" << static_cast<double>(amount)
                  << " spot=" << static_cast<double>(ctx.pool.spot_price()) << "\n";
    }

    uint64_t id_;
    Wallet<T> wallet_{};
    AgentDiagnostics<T> diag_{};
};

} // namespace agents
} // namespace stablesim
