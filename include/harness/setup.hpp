// Build a ready-to-run scheduler from a run configuration
#pragma once

#include <memory>
#include <random>
#include <utility>
#include <vector>

#include "agents/liquidity_provider.hpp"
#include "agents/shorter.hpp"
#include "agents/trend_long.hpp"
#include "core/random.hpp"
#include "events/loader.hpp"
#include "harness/config.hpp"
#include "harness/scheduler.hpp"

namespace stablesim {
namespace harness {

// Draw each agent's kind from the configured proportions, then its parameters
template <typename T>
std::vector<std::unique_ptr<agents::Agent<T>>> build_population(const SimConfig<T>& c, Rng& rng) {
    using namespace agents;
    std::discrete_distribution<int> pick({
        static_cast<double>(c.proportions.liquidity_provider),
        static_cast<double>(c.proportions.shorter),
        static_cast<double>(c.proportions.trend_long),
    });

    std::vector<std::unique_ptr<Agent<T>>> population;
    population.reserve(c.n_agents);
    for (uint64_t id = 0; id < c.n_agents; ++id) {
        switch (pick(rng)) {
            case 0:
                population.push_back(std::make_unique<LiquidityProvider<T>>(
                    LiquidityProvider<T>::draw(id, c.liquidity_provider, rng)));
                break;
            case 1:
                population.push_back(std::make_unique<Shorter<T>>(Shorter<T>::draw(id, c.shorter, rng)));
                break;
            default:
                population.push_back(std::make_unique<TrendLong<T>>(TrendLong<T>::draw(id, c.trend_long, rng)));
                break;
        }
    }
    return population;
}

template <typename T>
oracle::PriceOracle<T> build_oracle(const SimConfig<T>& c, Rng& rng) {
    if (c.price.mode == oracle::PriceMode::File) {
        const auto candles = load_candles(c.price.path, c.price.max_candles);
        return oracle::PriceOracle<T>(candle_closes(candles), c.n_steps());
    }
    return oracle::PriceOracle<T>(c.price, c.n_steps(), rng);
}

// Generator draws happen in a fixed order: population, then price path
template <typename T>
Scheduler<T> make_scheduler(const SimConfig<T>& c) {
    validate(c);
    Rng rng(c.seed);
    auto population = build_population(c, rng);
    auto oracle = build_oracle(c, rng);

    pools::LiquidityPool<T> pool(c.initial_stable, c.initial_ref);
    auto cp = c.controller;
    if (!(cp.initial_redemption_price > T(0))) {
        cp.initial_redemption_price = oracle.price_at(0) * pool.spot_price();
    }
    protocol::Controller<T> controller(cp);

    SchedulerOptions<T> opts{};
    opts.n_steps = c.n_steps();
    opts.twap_horizon = c.twap_horizon_hours;
    opts.rewards = agents::RewardParams<T>{c.reward_per_day, c.reward_total_supply};
    opts.diag_start = c.diag_start;
    opts.diag_end = c.diag_end;

    return Scheduler<T>(std::move(pool), std::move(controller), std::move(oracle),
                        std::move(population), rng, opts);
}

} // namespace harness
} // namespace stablesim
