// stablesim - Entry point with compile-time numeric type selection
//
// Build targets:
//   stablesim    - double (default)
//   stablesim_ld - long double

#include <chrono>
#include <iostream>
#include <string>

#include "harness/cli.hpp"
#include "harness/config.hpp"
#include "harness/output.hpp"
#include "harness/runner.hpp"

// Compile-time numeric type selection (floating-only)
#if defined(STABLESIM_MODE_LD)
using RealT = long double;
static constexpr const char* TYPE_NAME = "long double";
#else
using RealT = double;
static constexpr const char* TYPE_NAME = "double";
#endif

int main(int argc, char* argv[]) {
    auto args = stablesim::harness::parse_cli(argc, argv);

    if (!args.valid) {
        std::cerr << "stablesim (" << TYPE_NAME << ")\n";
        std::cerr << "Error: " << args.error_msg << "\n";
        stablesim::harness::print_usage(argv[0]);
        return 1;
    }

    try {
        auto configs = stablesim::harness::load_sim_configs<RealT>(args.config_path);
        if (configs.empty()) {
            throw stablesim::InvalidConfiguration("No runs found in " + args.config_path);
        }

        // Command-line overrides apply to every run
        for (size_t i = 0; i < configs.size(); ++i) {
            auto& c = configs[i];
            if (args.has_seed) c.seed = args.seed + i;
            if (args.n_days > 0) c.n_days = args.n_days;
            if (args.n_agents > 0) c.n_agents = args.n_agents;
            if (!args.diagnostics) c.diag_end = 0;
            stablesim::harness::validate(c);
        }
        std::cout << "loaded " << configs.size() << " runs from " << args.config_path
                  << " (" << TYPE_NAME << ")\n" << std::flush;

        auto t_exec0 = std::chrono::high_resolution_clock::now();

        auto results = stablesim::harness::run_parallel(configs, args.n_threads, true);

        auto t_exec1 = std::chrono::high_resolution_clock::now();
        double exec_ms = std::chrono::duration<double, std::milli>(t_exec1 - t_exec0).count();

        stablesim::harness::OutputOptions out_opts{};
        out_opts.series_stride = args.series_stride;
        out_opts.diagnostics = args.diagnostics;
        if (!stablesim::harness::write_results_json(args.out_path, results, args.config_path,
                                                    args.n_threads, exec_ms, out_opts)) {
            std::cerr << "Error: failed to write output to " << args.out_path << "\n";
            return 1;
        }

        size_t failed = 0;
        for (const auto& r : results) {
            if (!r.success) ++failed;
        }
        if (failed > 0) {
            std::cerr << failed << "/" << results.size() << " runs failed\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
