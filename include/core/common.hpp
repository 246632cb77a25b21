// Common utilities: io_mu, trace flag, time units
#pragma once

#include <cstdlib>
#include <mutex>
#include <string>

namespace stablesim {

// Global mutex for synchronized console output
inline std::mutex io_mu;

// Debug flag - set TRACE_SIM=1 to print every agent action to stderr
inline bool trace_sim_enabled() {
    static const bool enabled = []() {
        const char* env = std::getenv("TRACE_SIM");
        return env && std::string(env) == "1";
    }();
    return enabled;
}

// Simulated time unit: one step is one hour
constexpr int HOURS_PER_DAY = 24;
constexpr int HOURS_PER_WEEK = 168;
constexpr int DAYS_PER_YEAR = 365;
constexpr int HOURS_PER_YEAR = HOURS_PER_DAY * DAYS_PER_YEAR;

} // namespace stablesim
