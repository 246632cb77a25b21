// Run executor - single run execution and parallel multi-run processing
#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/json.hpp>

#include "core/common.hpp"
#include "harness/config.hpp"
#include "harness/scheduler.hpp"
#include "harness/series.hpp"
#include "harness/setup.hpp"

namespace stablesim {
namespace harness {

// Result from executing a single run
template <typename T>
struct RunResult {
    std::string tag;
    uint64_t seed{0};

    RunOutcome outcome{RunOutcome::Completed};
    uint64_t halted_at_step{0};
    std::string halt_reason;
    uint64_t steps_run{0};

    // Final state
    std::array<T, 2> reserves{T(0), T(0)};
    T total_supply{0};
    T redemption_price{0};
    T redemption_rate{0};
    size_t open_safes{0};
    T safe_debt{0};

    // Population
    uint64_t n_liquidity_providers{0};
    uint64_t n_shorters{0};
    uint64_t n_trend_longs{0};
    uint64_t entries{0};
    uint64_t exits{0};
    T external_funding{0};

    RunSeries<T> series{};
    std::vector<AgentSeries<T>> agent_series{};

    // Echo back original JSON for params block
    boost::json::object echo{};

    double elapsed_ms{0};

    bool success{false};
    std::string error_msg;
};

// Copy everything worth reporting out of a finished scheduler
template <typename T>
void collect_result(const Scheduler<T>& s, RunResult<T>& r) {
    r.outcome = s.outcome();
    r.halted_at_step = s.halted_at_step();
    r.halt_reason = s.halt_reason();
    r.steps_run = s.current_step();

    r.reserves = s.pool().reserves;
    r.total_supply = s.pool().total_supply;
    r.redemption_price = s.controller().redemption_price();
    r.redemption_rate = s.controller().redemption_rate();
    r.open_safes = s.safes().open_safes();
    r.safe_debt = s.safes().total_debt();

    for (const auto& a : s.agents()) {
        switch (a->kind()) {
            case agents::AgentKind::LiquidityProvider: ++r.n_liquidity_providers; break;
            case agents::AgentKind::Shorter:           ++r.n_shorters; break;
            case agents::AgentKind::TrendLong:         ++r.n_trend_longs; break;
        }
        r.entries += a->diagnostics().entries;
        r.exits += a->diagnostics().exits;
        r.external_funding += a->diagnostics().external_funding;
    }
    r.series = s.series();
    r.agent_series = s.agent_series();
}

// Execute one configured run; errors are recorded on the result
template <typename T>
RunResult<T> run_single(const SimConfig<T>& cfg) {
    RunResult<T> result;
    result.tag = cfg.tag;
    result.seed = cfg.seed;
    result.echo = cfg.echo;

    auto t_start = std::chrono::high_resolution_clock::now();

    try {
        auto scheduler = make_scheduler(cfg);
        scheduler.run();
        collect_result(scheduler, result);
        if (result.outcome != RunOutcome::Completed) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "run " << (cfg.tag.empty() ? std::to_string(cfg.seed) : cfg.tag)
                      << " halted at step " << result.halted_at_step << ": " << result.halt_reason << "\n";
        }
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_msg = e.what();
        std::lock_guard<std::mutex> lock(io_mu);
        std::cerr << "run " << (cfg.tag.empty() ? std::to_string(cfg.seed) : cfg.tag)
                  << " failed: " << e.what() << "\n";
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    return result;
}

// Run multiple configurations in parallel using a thread pool
template <typename T>
std::vector<RunResult<T>> run_parallel(
    const std::vector<SimConfig<T>>& configs,
    size_t n_threads = 0,
    bool verbose = true
) {
    if (n_threads == 0) {
        n_threads = std::thread::hardware_concurrency();
        if (n_threads == 0) n_threads = 1;
    }

    const size_t n_runs = configs.size();
    std::vector<RunResult<T>> results(n_runs);

    if (n_runs == 0) {
        return results;
    }

    auto run_one = [&](size_t i) {
        if (verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "dispatch run " << (i + 1) << "/" << n_runs << "\n";
        }

        results[i] = run_single(configs[i]);

        if (verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "finished run " << (i + 1) << "/" << n_runs
                      << ", time: " << std::fixed << std::setprecision(4)
                      << (results[i].elapsed_ms / 1000.0) << " s\n";
        }
    };

    // For single run or single thread, run sequentially
    if (n_runs == 1 || n_threads == 1) {
        for (size_t i = 0; i < n_runs; ++i) {
            run_one(i);
        }
        return results;
    }

    // Thread pool with work stealing via atomic index
    std::atomic<size_t> next_idx{0};

    auto worker = [&]() {
        while (true) {
            const size_t i = next_idx.fetch_add(1);
            if (i >= n_runs) break;
            run_one(i);
        }
    };

    const size_t actual_threads = std::min(n_threads, n_runs);
    std::vector<std::thread> threads;
    threads.reserve(actual_threads);

    for (size_t t = 0; t < actual_threads; ++t) {
        threads.emplace_back(worker);
    }

    for (auto& th : threads) {
        th.join();
    }

    return results;
}

} // namespace harness
} // namespace stablesim
