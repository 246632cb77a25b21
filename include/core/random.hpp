// Run-owned pseudo-random generator and distribution helpers
#pragma once

#include <cstdint>
#include <random>

namespace stablesim {

// Each run owns exactly one generator, seeded once; nothing random is global
using Rng = std::mt19937_64;

// Closed parameter range for a uniform draw
template <typename T>
struct Range {
    T lo{0};
    T hi{0};

    bool valid() const { return lo <= hi; }
};

template <typename T>
inline T draw_uniform(Rng& rng, const Range<T>& r) {
    if (!(r.hi > r.lo)) return r.lo;
    std::uniform_real_distribution<T> dist(r.lo, r.hi);
    return dist(rng);
}

// Integer draw truncated from a uniform real draw (run lengths in weeks)
template <typename T>
inline int draw_count(Rng& rng, const Range<T>& r) {
    return static_cast<int>(draw_uniform(rng, r));
}

} // namespace stablesim
