// Exogenous reference-asset price path (fiat per unit of reference asset)
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/random.hpp"

namespace stablesim {
namespace oracle {

enum class PriceMode { Constant, Linear, RandomWalk, File };

inline const char* to_string(PriceMode m) {
    switch (m) {
        case PriceMode::Constant:   return "constant";
        case PriceMode::Linear:     return "linear";
        case PriceMode::RandomWalk: return "random_walk";
        case PriceMode::File:       return "file";
    }
    return "constant";
}

inline PriceMode parse_price_mode(const std::string& s) {
    if (s == "constant") return PriceMode::Constant;
    if (s == "linear") return PriceMode::Linear;
    if (s == "random_walk") return PriceMode::RandomWalk;
    if (s == "file") return PriceMode::File;
    throw InvalidConfiguration("unknown price mode: " + s);
}

template <typename T>
struct PricePathCfg {
    PriceMode mode{PriceMode::RandomWalk};
    T initial{T(1500)};
    T final_price{T(2000)};
    T lower{T(1500)};
    T upper{T(2000)};
    T step_std{T(5)};       // scale of the uniform random-walk increments
    std::string path;       // candles file for PriceMode::File
    size_t max_candles{0};
};

namespace detail {

template <typename T>
inline std::vector<T> linspace(T start, T end, size_t n) {
    std::vector<T> out(n, start);
    if (n < 2) return out;
    const T step = (end - start) / static_cast<T>(n - 1);
    for (size_t i = 0; i < n; ++i) {
        out[i] = start + step * static_cast<T>(i);
    }
    out[n - 1] = end;
    return out;
}

} // namespace detail

// Random walk pinned to the start->end trend line, with excursions folded back
// inside [lower, upper]
template <typename T>
std::vector<T> bounded_random_walk(size_t n, T lower, T upper, T start, T end, T step_std, Rng& rng) {
    if (n == 0) return {};
    if (!(lower <= start && lower <= end && start <= upper && end <= upper)) {
        throw InvalidConfiguration("random walk bounds must contain the initial and final prices");
    }
    const T bounds = upper - lower;

    std::uniform_real_distribution<T> unit(T(0), T(1));
    std::vector<T> walk(n);
    T acc = T(0);
    for (size_t i = 0; i < n; ++i) {
        acc += step_std * (unit(rng) - T(0.5));
        walk[i] = acc;
    }

    const auto walk_trend = detail::linspace(walk.front(), walk.back(), n);
    std::vector<T> deltas(n);
    for (size_t i = 0; i < n; ++i) {
        deltas[i] = walk[i] - walk_trend[i];
    }
    const auto mm = std::minmax_element(deltas.begin(), deltas.end());
    const T spread = *mm.second - *mm.first;
    const T squeeze = (bounds > T(0)) ? std::max(T(1), spread / bounds) : T(1);

    const auto trend = detail::linspace(start, end, n);
    std::vector<T> out(n);
    for (size_t i = 0; i < n; ++i) {
        T d = (bounds > T(0)) ? deltas[i] / squeeze : T(0);
        const T up = upper - trend[i];
        const T lo = lower - trend[i];
        if (d - up >= T(0)) d = up - (d - up);
        if (lo - d >= T(0)) d = lo + (lo - d);
        out[i] = trend[i] + d;
    }
    return out;
}

template <typename T>
class PriceOracle {
public:
    // Precomputes the whole path of n_steps prices
    PriceOracle(const PricePathCfg<T>& cfg, size_t n_steps, Rng& rng) : mode_(cfg.mode) {
        switch (cfg.mode) {
            case PriceMode::Constant:
                path_.assign(n_steps, cfg.initial);
                break;
            case PriceMode::Linear:
                path_ = detail::linspace(cfg.initial, cfg.final_price, n_steps);
                break;
            case PriceMode::RandomWalk:
                path_ = bounded_random_walk(n_steps, cfg.lower, cfg.upper, cfg.initial, cfg.final_price,
                                            cfg.step_std, rng);
                break;
            case PriceMode::File:
                throw InvalidConfiguration("file price paths are built from loaded prices");
        }
        validate();
    }

    // Recorded path (e.g. candle closes), truncated to n_steps
    PriceOracle(const std::vector<double>& prices, size_t n_steps) : mode_(PriceMode::File) {
        if (prices.size() < n_steps) {
            throw InvalidConfiguration("price file holds " + std::to_string(prices.size()) +
                                       " prices, need " + std::to_string(n_steps));
        }
        path_.reserve(n_steps);
        for (size_t i = 0; i < n_steps; ++i) {
            path_.push_back(static_cast<T>(prices[i]));
        }
        validate();
    }

    T price_at(size_t step) const {
        if (step >= path_.size()) {
            throw InvalidAmount("price requested past the end of the path (step " + std::to_string(step) + ")");
        }
        return path_[step];
    }

    size_t size() const { return path_.size(); }
    PriceMode mode() const { return mode_; }
    const std::vector<T>& path() const { return path_; }

private:
    void validate() const {
        for (const T p : path_) {
            if (!(p > T(0))) {
                throw InvalidConfiguration("reference price path must stay positive");
            }
        }
    }

    PriceMode mode_;
    std::vector<T> path_;
};

} // namespace oracle
} // namespace stablesim
