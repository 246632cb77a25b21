// Run configuration: parsing, validation and loading
#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "agents/liquidity_provider.hpp"
#include "agents/shorter.hpp"
#include "agents/trend_long.hpp"
#include "core/common.hpp"
#include "core/errors.hpp"
#include "core/json_utils.hpp"
#include "core/random.hpp"
#include "oracle/price_oracle.hpp"
#include "protocol/controller.hpp"
#include "protocol/safe_engine.hpp"

namespace stablesim {
namespace harness {

// Population split in percent
template <typename T>
struct Proportions {
    T liquidity_provider{T(20)};
    T shorter{T(80)};
    T trend_long{T(0)};

    T sum() const { return liquidity_provider + shorter + trend_long; }
};

// One simulation run (all parameters, unit-scaled)
template <typename T>
struct SimConfig {
    std::string tag;
    uint64_t seed{42};

    // Global
    uint64_t n_agents{200};
    uint64_t n_days{365};
    T reward_per_day{T(334)};
    T reward_total_supply{T(1000000)};

    oracle::PricePathCfg<T> price{};

    // Seeded pool reserves
    T initial_stable{T(10000000)};
    T initial_ref{T(20940)};

    Proportions<T> proportions{};
    agents::LiquidityProviderParams<T> liquidity_provider{};
    agents::ShorterParams<T> shorter{};
    agents::TrendLongParams<T> trend_long{};

    // initial_redemption_price <= 0 derives the price from the seeded pool
    protocol::ControllerParams<T> controller{};
    uint64_t twap_horizon_hours{16};

    // Per-agent diagnostics window [start, end); end 0 means no diagnostics
    uint64_t diag_start{0};
    uint64_t diag_end{0};

    // Echo back original JSON for the params block
    boost::json::object echo{};

    uint64_t n_steps() const { return n_days * static_cast<uint64_t>(HOURS_PER_DAY); }
};

namespace detail {

template <typename T>
inline void check_range(const Range<T>& r, const std::string& name) {
    if (!(r.lo >= T(0)) || !r.valid()) {
        throw InvalidConfiguration(name + ": bounds must be non-negative with lower <= upper");
    }
}

template <typename T>
inline void check_collateralization(const Range<T>& r, const std::string& name) {
    check_range(r, name);
    if (!(r.lo > T(protocol::MIN_COLLATERALIZATION_PCT))) {
        throw InvalidConfiguration(name + ": collateralization must exceed the 145% minimum");
    }
}

} // namespace detail

// Reject configurations that cannot run; raises InvalidConfiguration
template <typename T>
void validate(const SimConfig<T>& c) {
    using detail::check_range;
    if (c.n_agents == 0) throw InvalidConfiguration("n_agents must be positive");
    if (c.n_days == 0) throw InvalidConfiguration("n_days must be positive");
    if (!(c.initial_stable > T(0)) || !(c.initial_ref > T(0))) {
        throw InvalidConfiguration("initial pool reserves must be positive");
    }
    if (!(c.reward_total_supply > T(0)) || c.reward_per_day < T(0)) {
        throw InvalidConfiguration("reward supply must be positive and emission non-negative");
    }

    const auto& pr = c.proportions;
    if (pr.liquidity_provider < T(0) || pr.shorter < T(0) || pr.trend_long < T(0)) {
        throw InvalidConfiguration("agent proportions must be non-negative");
    }
    if (std::abs(pr.sum() - T(100)) > T(1e-9)) {
        throw InvalidConfiguration("agent proportions must sum to 100");
    }

    check_range(c.liquidity_provider.holdings, "liquidity_provider.holdings");
    check_range(c.liquidity_provider.valuation, "liquidity_provider.valuation");
    check_range(c.liquidity_provider.return_threshold, "liquidity_provider.return_threshold");

    check_range(c.shorter.holdings, "shorter.holdings");
    check_range(c.shorter.difference_threshold, "shorter.difference_threshold");
    check_range(c.shorter.stop_loss, "shorter.stop_loss");
    detail::check_collateralization(c.shorter.collateralization, "shorter.collateralization");
    if (c.shorter.take_profit_lookback == 0) {
        throw InvalidConfiguration("shorter.take_profit_lookback must be at least one step");
    }

    check_range(c.trend_long.holdings, "trend_long.holdings");
    check_range(c.trend_long.uptrend_weeks, "trend_long.uptrend_weeks");
    check_range(c.trend_long.downtrend_weeks, "trend_long.downtrend_weeks");
    if (c.trend_long.uptrend_weeks.lo < T(1) || c.trend_long.downtrend_weeks.lo < T(1)) {
        throw InvalidConfiguration("trend_long week counts must be at least 1");
    }
    check_range(c.trend_long.stop_loss, "trend_long.stop_loss");
    detail::check_collateralization(c.trend_long.collateralization, "trend_long.collateralization");
    if (!(c.trend_long.liquidation_guard_pct > T(protocol::MIN_COLLATERALIZATION_PCT))) {
        throw InvalidConfiguration("trend_long.liquidation_guard must exceed the 145% minimum");
    }

    const auto& p = c.price;
    if (p.mode == oracle::PriceMode::File) {
        if (p.path.empty()) throw InvalidConfiguration("file price mode needs a path");
    } else {
        if (!(p.initial > T(0))) throw InvalidConfiguration("initial reference price must be positive");
        if (p.mode != oracle::PriceMode::Constant && !(p.final_price > T(0))) {
            throw InvalidConfiguration("final reference price must be positive");
        }
    }
    if (p.mode == oracle::PriceMode::RandomWalk) {
        if (!(p.lower > T(0)) || p.lower > p.upper) {
            throw InvalidConfiguration("price bounds must be positive with lower <= upper");
        }
        if (p.initial < p.lower || p.initial > p.upper || p.final_price < p.lower || p.final_price > p.upper) {
            throw InvalidConfiguration("price bounds must contain the initial and final prices");
        }
        if (p.step_std < T(0)) throw InvalidConfiguration("price step_std must be non-negative");
    }

    if (c.controller.update_period == 0) {
        throw InvalidConfiguration("controller update_period must be at least 1");
    }
    if (c.twap_horizon_hours == 0) throw InvalidConfiguration("twap horizon must be positive");
    if (c.diag_end != 0 && c.diag_end < c.diag_start) {
        throw InvalidConfiguration("diagnostics end_step precedes start_step");
    }
}

// Parse one run object. Missing keys keep their defaults.
template <typename T>
SimConfig<T> parse_sim_config(const boost::json::object& entry) {
    SimConfig<T> c{};
    c.echo = entry;
    c.tag = get_str_opt(entry, "tag", "");
    c.seed = get_u64_opt(entry, "seed", c.seed);

    const auto& g = get_section(entry, "global");
    c.n_agents = get_u64_opt(g, "n_agents", c.n_agents);
    c.n_days = get_u64_opt(g, "n_days", c.n_days);
    c.reward_per_day = get_real_opt(g, "reward_per_day", c.reward_per_day);
    c.reward_total_supply = get_real_opt(g, "reward_total_supply", c.reward_total_supply);

    const auto& p = get_section(entry, "price");
    if (p.contains("mode")) c.price.mode = oracle::parse_price_mode(get_str(p, "mode"));
    c.price.initial = get_real_opt(p, "initial", c.price.initial);
    c.price.final_price = get_real_opt(p, "final", c.price.final_price);
    c.price.lower = get_real_opt(p, "lower", c.price.lower);
    c.price.upper = get_real_opt(p, "upper", c.price.upper);
    c.price.step_std = get_real_opt(p, "step_std", c.price.step_std);
    c.price.path = get_str_opt(p, "path", c.price.path);
    c.price.max_candles = get_u64_opt(p, "max_candles", c.price.max_candles);

    const auto& pool = get_section(entry, "pool");
    c.initial_stable = get_real_opt(pool, "initial_stable", c.initial_stable);
    c.initial_ref = get_real_opt(pool, "initial_ref", c.initial_ref);

    const auto& pr = get_section(entry, "proportions");
    c.proportions.liquidity_provider = get_real_opt(pr, "liquidity_provider", c.proportions.liquidity_provider);
    c.proportions.shorter = get_real_opt(pr, "shorter", c.proportions.shorter);
    c.proportions.trend_long = get_real_opt(pr, "trend_long", c.proportions.trend_long);

    const auto& lp = get_section(entry, "liquidity_provider");
    auto& lpp = c.liquidity_provider;
    lpp.holdings = get_range_opt(lp, "holdings", lpp.holdings);
    lpp.valuation = get_range_opt(lp, "valuation", lpp.valuation);
    lpp.return_threshold = get_range_opt(lp, "return_threshold", lpp.return_threshold);

    const auto& sh = get_section(entry, "shorter");
    auto& shp = c.shorter;
    shp.holdings = get_range_opt(sh, "holdings", shp.holdings);
    shp.difference_threshold = get_range_opt(sh, "difference_threshold", shp.difference_threshold);
    shp.stop_loss = get_range_opt(sh, "stop_loss", shp.stop_loss);
    shp.collateralization = get_range_opt(sh, "collateralization", shp.collateralization);
    shp.take_profit_lookback = get_u64_opt(sh, "take_profit_lookback", shp.take_profit_lookback);

    const auto& tl = get_section(entry, "trend_long");
    auto& tlp = c.trend_long;
    tlp.holdings = get_range_opt(tl, "holdings", tlp.holdings);
    tlp.uptrend_weeks = get_range_opt(tl, "uptrend_weeks", tlp.uptrend_weeks);
    tlp.downtrend_weeks = get_range_opt(tl, "downtrend_weeks", tlp.downtrend_weeks);
    tlp.stop_loss = get_range_opt(tl, "stop_loss", tlp.stop_loss);
    tlp.collateralization = get_range_opt(tl, "collateralization", tlp.collateralization);
    tlp.liquidation_guard_pct = get_real_opt(tl, "liquidation_guard", tlp.liquidation_guard_pct);

    const auto& ctl = get_section(entry, "controller");
    auto& cp = c.controller;
    cp.kp = get_real_opt(ctl, "kp", cp.kp);
    cp.ki = get_real_opt(ctl, "ki", cp.ki);
    cp.kd = get_real_opt(ctl, "kd", cp.kd);
    cp.update_period = get_u64_opt(ctl, "update_period", cp.update_period);
    cp.warmup_steps = get_u64_opt(ctl, "warmup_steps", cp.warmup_steps);
    cp.initial_redemption_price = get_real_opt(ctl, "initial_redemption_price", cp.initial_redemption_price);

    c.twap_horizon_hours = get_u64_opt(get_section(entry, "twap"), "horizon_hours", c.twap_horizon_hours);

    const auto& dg = get_section(entry, "diagnostics");
    c.diag_start = get_u64_opt(dg, "start_step", c.diag_start);
    c.diag_end = get_u64_opt(dg, "end_step", c.diag_end);

    return c;
}

// Parse a JSON document holding either one run object or { "runs": [...] }
template <typename T>
std::vector<SimConfig<T>> parse_sim_configs(const std::string& text) {
    namespace json = boost::json;

    json::value root;
    try {
        root = json::parse(text);
    } catch (const std::exception& e) {
        throw InvalidConfiguration(std::string("malformed config json: ") + e.what());
    }

    std::vector<json::object> entries;
    if (root.is_object()) {
        const auto& obj = root.as_object();
        if (auto* runs = obj.if_contains("runs")) {
            if (!runs->is_array()) throw InvalidConfiguration("'runs' must be an array");
            for (const auto& v : runs->as_array()) {
                if (!v.is_object()) throw InvalidConfiguration("each run must be an object");
                entries.push_back(v.as_object());
            }
        } else {
            entries.push_back(obj);
        }
    } else {
        throw InvalidConfiguration("config json root must be an object");
    }

    std::vector<SimConfig<T>> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        auto c = parse_sim_config<T>(entry);
        validate(c);
        result.push_back(std::move(c));
    }
    return result;
}

template <typename T>
std::vector<SimConfig<T>> load_sim_configs(const std::string& path) {
    std::string text;
    try {
        text = read_file(path);
    } catch (const std::exception& e) {
        throw InvalidConfiguration("cannot read config file " + path + ": " + e.what());
    }
    return parse_sim_configs<T>(text);
}

} // namespace harness
} // namespace stablesim
