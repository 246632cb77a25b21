// Events module - data types for recorded price candles
#pragma once

#include <cstdint>

namespace stablesim {

// Recorded candle: only the close drives the reference price path
struct Candle {
    uint64_t ts;
    double close;
};

} // namespace stablesim
