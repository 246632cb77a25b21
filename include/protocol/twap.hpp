// Time-weighted average price over a rolling window of end-of-step samples
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

#include "core/errors.hpp"

namespace stablesim {
namespace protocol {

template <typename T>
struct PriceSample {
    uint64_t ts;   // simulated hours
    T price;
};

template <typename T>
class TwapTracker {
public:
    // horizon and sample_interval in simulated hours; seed_price is reported
    // until the first sample arrives
    explicit TwapTracker(T seed_price, uint64_t horizon = 16, uint64_t sample_interval = 1)
        : seed_price_(seed_price),
          horizon_(horizon > 0 ? horizon : 1),
          interval_(sample_interval > 0 ? sample_interval : 1) {}

    void update(uint64_t ts, T price) {
        require_finite(price, "TWAP sample price");
        if (!samples_.empty() && ts <= samples_.back().ts) {
            throw InvalidAmount("TWAP samples must have strictly increasing timestamps");
        }
        samples_.push_back({ts, price});
        // Keep samples whose [ts, ts + interval) overlaps (now - horizon, now]
        const uint64_t end = ts + interval_;
        while (!samples_.empty() && samples_.front().ts + horizon_ < end) {
            samples_.pop_front();
        }
        twap_ = compute();
    }

    // Average over the retained window (available samples only before it fills)
    T twap() const { return samples_.empty() ? seed_price_ : twap_; }

    bool full() const { return samples_.size() * interval_ >= horizon_; }
    size_t size() const { return samples_.size(); }
    uint64_t horizon() const { return horizon_; }
    const std::deque<PriceSample<T>>& samples() const { return samples_; }

private:
    // Weighted deviations from the oldest price: a constant window yields
    // exactly that price
    T compute() const {
        const T base = samples_.front().price;
        T weighted_dev = T(0);
        T total_dt = T(0);
        for (size_t i = 0; i < samples_.size(); ++i) {
            const uint64_t next_ts = (i + 1 < samples_.size()) ? samples_[i + 1].ts : samples_[i].ts + interval_;
            const T dt = static_cast<T>(next_ts - samples_[i].ts);
            weighted_dev += (samples_[i].price - base) * dt;
            total_dt += dt;
        }
        return base + weighted_dev / total_dt;
    }

    T seed_price_;
    uint64_t horizon_;
    uint64_t interval_;
    std::deque<PriceSample<T>> samples_;
    T twap_{0};
};

} // namespace protocol
} // namespace stablesim
