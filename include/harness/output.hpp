// JSON output writer for run results
#pragma once

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "core/json_utils.hpp"
#include "harness/runner.hpp"

namespace json = boost::json;

namespace stablesim {
namespace harness {

struct OutputOptions {
    size_t series_stride{1};
    bool diagnostics{true};
};

// Final state and aggregate figures of one run
template <typename T>
json::object summary_json(const RunResult<T>& r) {
    json::object o;
    o["steps_run"] = r.steps_run;
    o["reserve_stable"] = to_json_real(r.reserves[0]);
    o["reserve_ref"] = to_json_real(r.reserves[1]);
    o["total_supply"] = to_json_real(r.total_supply);
    o["redemption_price"] = to_json_real(r.redemption_price);
    o["redemption_rate"] = to_json_real(r.redemption_rate);
    o["open_safes"] = static_cast<uint64_t>(r.open_safes);
    o["safe_debt"] = to_json_real(r.safe_debt);

    const auto& mp = r.series.market_price;
    if (!mp.empty()) {
        const auto mm = std::minmax_element(mp.begin(), mp.end());
        o["market_price_min"] = to_json_real(*mm.first);
        o["market_price_max"] = to_json_real(*mm.second);
        o["market_price_final"] = to_json_real(mp.back());
    }

    json::object population;
    population["liquidity_provider"] = r.n_liquidity_providers;
    population["shorter"] = r.n_shorters;
    population["trend_long"] = r.n_trend_longs;
    o["agents"] = population;
    o["entries"] = r.entries;
    o["exits"] = r.exits;
    o["external_funding"] = to_json_real(r.external_funding);
    return o;
}

template <typename T>
json::object series_json(const RunSeries<T>& s, size_t stride) {
    if (stride == 0) stride = 1;
    json::array steps;
    for (size_t i = 0; i < s.step.size(); i += stride) {
        steps.push_back(s.step[i]);
    }
    json::object o;
    o["step"] = steps;
    o["ref_price"] = to_json_array(s.ref_price, stride);
    o["spot_price"] = to_json_array(s.spot_price, stride);
    o["market_price"] = to_json_array(s.market_price, stride);
    o["twap"] = to_json_array(s.twap, stride);
    o["redemption_price"] = to_json_array(s.redemption_price, stride);
    o["redemption_rate"] = to_json_array(s.redemption_rate, stride);
    return o;
}

template <typename T>
json::array agents_json(const std::vector<AgentSeries<T>>& all) {
    json::array out;
    out.reserve(all.size());
    for (const auto& a : all) {
        json::object o;
        o["id"] = a.id;
        o["kind"] = agents::to_string(a.kind);
        json::array steps;
        for (const auto s : a.step) steps.push_back(s);
        o["step"] = steps;
        o["expected_return"] = to_json_array(a.expected_return);
        o["pool_share"] = to_json_array(a.pool_share);
        o["equity"] = to_json_array(a.equity);
        json::array flags;
        for (const bool f : a.in_position) flags.push_back(f);
        o["in_position"] = flags;
        out.push_back(std::move(o));
    }
    return out;
}

// Output format for the entire batch
template <typename T>
json::object build_output_json(
    const std::vector<RunResult<T>>& results,
    const std::string& config_path,
    size_t n_threads,
    double exec_ms,
    const OutputOptions& opts = {}
) {
    json::object meta;
    meta["config_file"] = config_path;
    meta["runs"] = static_cast<uint64_t>(results.size());
    meta["threads"] = static_cast<uint64_t>(n_threads);
    meta["exec_ms"] = exec_ms;

    json::array runs;
    runs.reserve(results.size());

    for (const auto& r : results) {
        json::object run;
        run["tag"] = r.tag;
        run["seed"] = r.seed;
        run["success"] = r.success;
        if (!r.success) {
            run["error"] = r.error_msg;
            run["params"] = r.echo;
            runs.push_back(std::move(run));
            continue;
        }
        run["outcome"] = to_string(r.outcome);
        if (r.outcome != RunOutcome::Completed) {
            run["halted_at_step"] = r.halted_at_step;
            run["halt_reason"] = r.halt_reason;
        }
        run["summary"] = summary_json(r);
        run["params"] = r.echo;
        run["series"] = series_json(r.series, opts.series_stride);
        if (opts.diagnostics && !r.agent_series.empty()) {
            run["agents"] = agents_json(r.agent_series);
        }
        runs.push_back(std::move(run));
    }

    json::object O;
    O["metadata"] = meta;
    O["runs"] = runs;
    return O;
}

// Write results to JSON file
template <typename T>
bool write_results_json(
    const std::string& output_path,
    const std::vector<RunResult<T>>& results,
    const std::string& config_path,
    size_t n_threads,
    double exec_ms,
    const OutputOptions& opts = {}
) {
    auto O = build_output_json(results, config_path, n_threads, exec_ms, opts);

    std::ofstream of(output_path);
    if (!of) {
        return false;
    }

    of << json::serialize(O) << '\n';
    return of.good();
}

} // namespace harness
} // namespace stablesim
