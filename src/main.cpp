/// @file src/main.cpp
/// @brief ecutune CLI entry point.
///
/// Usage:
///   ecutune                          Read one JSON request from stdin
///   ecutune --request <file>         Read one JSON request from a file
///   ecutune --curve <csv> [--seed N] [--budget N]
///                                    Optimize a CSV curve with default constraints
///   ecutune --verbose | --quiet      Log level (debug | warn); default info
///   ecutune --help                   Print usage
///
/// The JSON response is the only thing written to stdout.

#include "ecutune/constants.hpp"
#include "ecutune/contract.hpp"
#include "ecutune/curve_loader.hpp"
#include "ecutune/log.hpp"
#include "ecutune/runner.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  ecutune                              Read a JSON request from stdin\n"
        "  ecutune --request <file>             Read a JSON request from a file\n"
        "  ecutune --curve <csv> [--seed N] [--budget N]\n"
        "                                       Optimize a CSV torque curve\n"
        "  ecutune --verbose                    Debug logging on stderr\n"
        "  ecutune --quiet                      Only warnings and errors on stderr\n"
        "  ecutune --help                       Show this help\n"
        "\n"
        "CSV format (header required):\n"
        "  rpm,torque_nm\n"
    );
}

struct CliOptions {
    std::optional<std::string> request_file;
    std::optional<std::string> curve_file;
    std::int64_t seed   = 0;
    std::size_t  budget = ecutune::constants::DEFAULT_CYCLE_BUDGET;
    bool verbose = false;
    bool quiet   = false;
    bool help    = false;
};

/// Parse argv. Returns nullopt (after printing the reason) on bad usage.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--request" && has_value) {
            opts.request_file = std::string(argv[++i]);
        } else if (arg == "--curve" && has_value) {
            opts.curve_file = std::string(argv[++i]);
        } else if ((arg == "--seed" || arg == "--budget") && has_value) {
            const std::string value(argv[++i]);
            try {
                std::size_t pos = 0;
                const long long parsed = std::stoll(value, &pos);
                if (pos != value.size()) {
                    throw std::invalid_argument(value);
                }
                if (arg == "--seed") {
                    opts.seed = parsed;
                } else {
                    if (parsed < 1) {
                        fmt::print(stderr, "Error: --budget must be a positive integer\n");
                        return std::nullopt;
                    }
                    opts.budget = static_cast<std::size_t>(parsed);
                }
            } catch (const std::exception&) {
                fmt::print(stderr, "Error: {} expects an integer, got '{}'\n", arg, value);
                return std::nullopt;
            }
        } else {
            fmt::print(stderr, "Unknown or incomplete option: {}\n", arg);
            return std::nullopt;
        }
    }

    if (opts.request_file && opts.curve_file) {
        fmt::print(stderr, "Error: --request and --curve are mutually exclusive\n");
        return std::nullopt;
    }
    return opts;
}

/// Build a request document around a CSV curve using the default constraints.
std::optional<std::string> request_from_curve(const CliOptions& opts) {
    const auto curve = ecutune::core::CurveLoader::load_csv(*opts.curve_file);
    if (!curve) {
        fmt::print(stderr, "Error: no valid curve loaded from '{}'\n", *opts.curve_file);
        return std::nullopt;
    }

    namespace k = ecutune::constants;
    nlohmann::json ranges = nlohmann::json::object();
    for (const auto param : ecutune::ALL_CALIBRATION_PARAMS) {
        const auto r = ecutune::default_range(param);
        ranges[std::string(ecutune::to_string(param))] = {r.lo, r.hi};
    }

    const nlohmann::json doc = {
        {"contract_version", std::string(k::CONTRACT_VERSION)},
        {"request_id",       "cli-" + *opts.curve_file},
        {"seed",             opts.seed},
        {"cycle_budget",     opts.budget},
        {"baseline_curve", {
            {"rpm_bins",  curve->rpm_bins},
            {"torque_nm", std::vector<double>(curve->torque_nm.data(),
                                              curve->torque_nm.data() + curve->torque_nm.size())},
        }},
        {"constraints", {
            {"max_peak_gain_ratio", k::DEFAULT_MAX_PEAK_GAIN_RATIO},
            {"max_bin_delta_nm",    k::DEFAULT_MAX_BIN_DELTA_NM},
            {"max_bin_delta_ratio", k::DEFAULT_MAX_BIN_DELTA_RATIO},
            {"smoothness",          {{"max_second_derivative", k::DEFAULT_MAX_SECOND_DERIVATIVE}}},
            {"calibration_ranges",  ranges},
        }},
    };
    return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<std::string> read_request(const CliOptions& opts) {
    if (opts.curve_file) {
        return request_from_curve(opts);
    }
    if (opts.request_file) {
        std::ifstream file(*opts.request_file);
        if (!file.is_open()) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.request_file);
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return contents.str();
    }
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    if (opts->help) {
        print_usage();
        return 0;
    }

    if (opts->verbose) {
        ecutune::log::set_level(ecutune::log::Level::Debug);
    } else if (opts->quiet) {
        ecutune::log::set_level(ecutune::log::Level::Warn);
    }

    const auto request_text = read_request(*opts);
    if (!request_text) {
        return 1;
    }

    ecutune::core::RunnerConfig config;
    config.search.verbose = opts->verbose;
    const ecutune::core::Runner runner(config);

    const auto response = runner.respond(*request_text);
    fmt::print("{}\n", ecutune::contract::to_json(response).dump(
                            -1, ' ', false, nlohmann::json::error_handler_t::replace));
    return ecutune::core::Runner::exit_code(response);
}
