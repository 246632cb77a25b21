// Events module - candle loading for recorded reference-asset price paths
#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace stablesim {

// Load candles from JSON file, sorted by timestamp and then truncated to the
// first max_candles (0 keeps all). Raises InvalidConfiguration on a missing or
// malformed file.
// Format: array of [ts, open, high, low, close, volume]; ts and close are read
std::vector<Candle> load_candles(const std::string& path, size_t max_candles = 0);

// Close prices in candle order, one per simulated step
std::vector<double> candle_closes(const std::vector<Candle>& candles);

} // namespace stablesim
