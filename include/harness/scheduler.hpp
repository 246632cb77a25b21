// Discrete-time scheduler: one step per simulated hour
#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "agents/agent.hpp"
#include "core/errors.hpp"
#include "core/random.hpp"
#include "harness/series.hpp"
#include "oracle/price_oracle.hpp"
#include "pools/constant_product.hpp"
#include "protocol/controller.hpp"
#include "protocol/safe_engine.hpp"
#include "protocol/twap.hpp"

namespace stablesim {
namespace harness {

enum class RunOutcome { Completed, PoolDepleted, NumericDivergence };

inline const char* to_string(RunOutcome o) {
    switch (o) {
        case RunOutcome::Completed:         return "completed";
        case RunOutcome::PoolDepleted:      return "pool_depleted";
        case RunOutcome::NumericDivergence: return "numeric_divergence";
    }
    return "completed";
}

template <typename T>
struct SchedulerOptions {
    uint64_t n_steps{0};
    uint64_t twap_horizon{16};
    agents::RewardParams<T> rewards{};
    uint64_t diag_start{0};
    uint64_t diag_end{0};   // exclusive; 0 disables per-agent diagnostics
};

template <typename T>
class Scheduler {
public:
    using AgentPtr = std::unique_ptr<agents::Agent<T>>;

    Scheduler(pools::LiquidityPool<T> pool,
              protocol::Controller<T> controller,
              oracle::PriceOracle<T> oracle,
              std::vector<AgentPtr> agents,
              Rng rng,
              const SchedulerOptions<T>& opts)
        : pool_(std::move(pool)),
          controller_(std::move(controller)),
          oracle_(std::move(oracle)),
          twap_(pool_.spot_price(), opts.twap_horizon),
          agents_(std::move(agents)),
          rng_(rng),
          opts_(opts),
          order_(agents_.size()) {
        if (oracle_.size() < opts_.n_steps) {
            throw InvalidConfiguration("price path is shorter than the run");
        }
        std::iota(order_.begin(), order_.end(), size_t(0));
        series_.reserve(opts_.n_steps);
        rate_history_.reserve(opts_.n_steps);
        if (opts_.diag_end > opts_.diag_start) {
            agent_series_.resize(agents_.size());
            for (size_t i = 0; i < agents_.size(); ++i) {
                agent_series_[i].id = agents_[i]->id();
                agent_series_[i].kind = agents_[i]->kind();
            }
        }
    }

    // Advance one step. A failing activation restores the pool and safe
    // engine to their state before that agent acted, then rethrows.
    void step() {
        if (step_ >= opts_.n_steps) {
            throw InvalidAmount("step past the end of the run");
        }
        const T ref_price = oracle_.price_at(step_);
        std::shuffle(order_.begin(), order_.end(), rng_);

        agents::MarketContext<T> ctx{pool_, safes_, controller_, oracle_, rate_history_,
                                     opts_.rewards, step_, ref_price};
        for (const size_t i : order_) {
            const pools::LiquidityPool<T> snapshot = pool_;
            safes_.checkpoint();
            try {
                agents_[i]->decide_and_act(ctx);
            } catch (const SimulationError&) {
                pool_ = snapshot;
                safes_.rollback();
                throw;
            }
        }

        const T spot = require_finite(pool_.spot_price(), "spot price");
        twap_.update(step_, spot);
        const T twap_fiat = require_finite(twap_.twap() * ref_price, "TWAP");
        controller_.step(step_, twap_fiat);

        rate_history_.push_back(controller_.redemption_rate());
        series_.push(step_, ref_price, spot, spot * ref_price, twap_fiat,
                     controller_.redemption_price(), controller_.redemption_rate());
        if (step_ >= opts_.diag_start && step_ < opts_.diag_end) {
            for (size_t i = 0; i < agents_.size(); ++i) {
                agent_series_[i].push(step_, *agents_[i]);
            }
        }
        ++step_;
    }

    // Run to the horizon. PoolDepleted and NumericDivergence end the run as an
    // outcome; any other error propagates.
    RunOutcome run() {
        try {
            while (step_ < opts_.n_steps) {
                step();
            }
            outcome_ = RunOutcome::Completed;
        } catch (const SimulationError& e) {
            if (!e.is_terminal_state()) throw;
            outcome_ = e.kind() == ErrorKind::PoolDepleted ? RunOutcome::PoolDepleted
                                                            : RunOutcome::NumericDivergence;
            halted_at_ = step_;
            halt_reason_ = e.what();
        }
        return outcome_;
    }

    // Shares held by agents plus the seed share
    T accounted_shares() const {
        T total = pool_.seed_shares;
        for (const auto& a : agents_) total += a->wallet().shares;
        return total;
    }

    uint64_t current_step() const { return step_; }
    RunOutcome outcome() const { return outcome_; }
    uint64_t halted_at_step() const { return halted_at_; }
    const std::string& halt_reason() const { return halt_reason_; }

    const pools::LiquidityPool<T>& pool() const { return pool_; }
    const protocol::Controller<T>& controller() const { return controller_; }
    const protocol::TwapTracker<T>& twap() const { return twap_; }
    const protocol::SafeEngine<T>& safes() const { return safes_; }
    const oracle::PriceOracle<T>& oracle() const { return oracle_; }
    const std::vector<AgentPtr>& agents() const { return agents_; }
    const RunSeries<T>& series() const { return series_; }
    const std::vector<AgentSeries<T>>& agent_series() const { return agent_series_; }
    const SchedulerOptions<T>& options() const { return opts_; }

private:
    pools::LiquidityPool<T> pool_;
    protocol::Controller<T> controller_;
    oracle::PriceOracle<T> oracle_;
    protocol::TwapTracker<T> twap_;
    protocol::SafeEngine<T> safes_{};
    std::vector<AgentPtr> agents_;
    Rng rng_;
    SchedulerOptions<T> opts_;

    std::vector<size_t> order_;
    std::vector<T> rate_history_;
    uint64_t step_{0};

    RunSeries<T> series_{};
    std::vector<AgentSeries<T>> agent_series_{};
    RunOutcome outcome_{RunOutcome::Completed};
    uint64_t halted_at_{0};
    std::string halt_reason_;
};

} // namespace harness
} // namespace stablesim
