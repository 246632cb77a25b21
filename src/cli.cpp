// CLI argument parsing implementation

#include "harness/cli.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace stablesim {
namespace harness {

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " <config.json> <output.json>\n"
              << "       [--threads N | -n N] [--seed S]\n"
              << "       [--days D] [--agents N]\n"
              << "       [--series-stride K] [--no-diagnostics]\n";
}

namespace {

uint64_t parse_u64(const std::string& flag, const char* text) {
    const std::string s(text);
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + s + "'");
    }
    return static_cast<uint64_t>(std::stoull(s));
}

} // namespace

CliArgs parse_cli(int argc, char* argv[]) {
    CliArgs args{};

    if (argc < 3) {
        args.valid = false;
        args.error_msg = "Not enough arguments (need config.json, output.json)";
        return args;
    }

    args.config_path = argv[1];
    args.out_path = argv[2];

    try {
        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if ((arg == "--threads" || arg == "-n") && has_value) {
                args.n_threads = static_cast<size_t>(parse_u64(arg, argv[++i]));
            } else if (arg == "--seed" && has_value) {
                args.seed = parse_u64(arg, argv[++i]);
                args.has_seed = true;
            } else if (arg == "--days" && has_value) {
                args.n_days = parse_u64(arg, argv[++i]);
            } else if (arg == "--agents" && has_value) {
                args.n_agents = parse_u64(arg, argv[++i]);
            } else if (arg == "--series-stride" && has_value) {
                args.series_stride = static_cast<size_t>(parse_u64(arg, argv[++i]));
            } else if (arg == "--no-diagnostics") {
                args.diagnostics = false;
            } else {
                throw std::invalid_argument("unknown or incomplete option: " + arg);
            }
        }
    } catch (const std::exception& e) {
        args.valid = false;
        args.error_msg = e.what();
        return args;
    }

    if (args.n_threads == 0) args.n_threads = 1;
    if (args.series_stride == 0) args.series_stride = 1;

    args.valid = true;
    return args;
}

} // namespace harness
} // namespace stablesim
