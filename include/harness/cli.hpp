// CLI argument parsing
#pragma once

#include <cstdint>
#include <string>
#include <thread>

namespace stablesim {
namespace harness {

struct CliArgs {
    // Positional arguments
    std::string config_path;
    std::string out_path;

    // Options
    size_t n_threads{std::thread::hardware_concurrency()};
    bool has_seed{false};
    uint64_t seed{0};                // overrides every run's seed (run i gets seed + i)
    uint64_t n_days{0};              // 0 = from config
    uint64_t n_agents{0};            // 0 = from config
    size_t series_stride{1};
    bool diagnostics{true};

    // Validation
    bool valid{false};
    std::string error_msg;
};

// Parse command line arguments
// Returns CliArgs with valid=true on success, valid=false with error_msg on failure
CliArgs parse_cli(int argc, char* argv[]);

// Print usage message
void print_usage(const char* prog_name);

} // namespace harness
} // namespace stablesim
