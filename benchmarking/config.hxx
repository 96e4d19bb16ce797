#pragma once

/**
 * @file config.hxx
 * @brief Run configuration (stopping criterion, filter) and its command-line / TOML surface
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../argparser/argparser.hxx"
#include "../errors/errors.hxx"
#include "../logger/logger.hxx"

namespace rangebench {

// ─────────────────────────────────────────────────────────────────────────────
// RunConfig — read-only for the whole run
// ─────────────────────────────────────────────────────────────────────────────

struct RunConfig {
    static constexpr std::chrono::nanoseconds DEFAULT_MIN_DURATION{1'000'000'000};
    static constexpr std::uint64_t DEFAULT_MIN_RUNS = 8;

    std::optional<std::string> filter;
    std::chrono::nanoseconds min_duration = DEFAULT_MIN_DURATION;
    std::uint64_t min_runs = DEFAULT_MIN_RUNS;

    /** A mean needs at least one run; the duration may legitimately be zero. */
    void validate() const {
        if (min_runs == 0) {
            throw ConfigError("min_runs must be at least 1");
        }
        if (min_duration.count() < 0) {
            throw ConfigError("min_duration must not be negative");
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// DriverOptions — everything a benchmark executable reads from its argv
// ─────────────────────────────────────────────────────────────────────────────

struct DriverOptions {
    RunConfig run;
    Logger::level log_level = Logger::level::WARNING;
    std::filesystem::path log_file;
    bool help = false;
};

namespace config_detail {

/**
 * Converts a --min_duration value to whole nanoseconds.
 *
 * @throws cli::ParseError for NaN, infinities, negatives, and anything that
 *         does not fit in a signed 64-bit nanosecond count (~292 years).
 */
inline auto seconds_to_ns(double seconds) -> std::chrono::nanoseconds {
    constexpr double NANOS_PER_SECOND = 1e9;
    constexpr double MAX_SECONDS = static_cast<double>(std::numeric_limits<std::int64_t>::max()) / NANOS_PER_SECOND;
    if (!std::isfinite(seconds) || seconds < 0.0 || !(seconds < MAX_SECONDS)) {
        std::ostringstream oss;
        oss << "--min_duration: " << seconds << " is not a representable number of seconds";
        throw cli::ParseError(oss.str());
    }
    return std::chrono::nanoseconds{static_cast<std::int64_t>(std::llround(seconds * NANOS_PER_SECOND))};
}

inline auto make_parser(const std::string& program) -> cli::ArgParser {
    cli::ArgParser parser(program, "Runs every registered benchmark over its input range and prints `Name,Time (ns)` CSV on stdout.");

    parser.add<std::string>("filter").shorthand('f').description("Only run benchmarks whose qualified name contains this string");
    parser.add<double>("min_duration")
        .shorthand('d')
        .description("Keep running each benchmark until this many seconds of active time")
        .default_val(1.0)
        .min(0.0);
    parser.add<int>("min_runs").shorthand('r').description("Run each benchmark at least this many times").default_val(8).min(1);
    parser.add<bool>("verbose").shorthand('v').description("Log each benchmark as it starts").default_val(false);
    parser.add<std::string>("log_level")
        .shorthand('l')
        .description("Minimum diagnostic level")
        .default_val(std::string("warning"))
        .allow<std::string>({"debug", "info", "warning", "error"});
    parser.add<std::filesystem::path>("log_file").description("Also append diagnostics to this file");
    return parser;
}

}  // namespace config_detail

/**
 * Builds the driver options from argv (and an optional --config TOML file).
 *
 * @throws cli::ParseError on unknown flags or out-of-range values.
 */
inline auto parse_driver_options(const std::string& program, const std::vector<std::string>& args) -> DriverOptions {
    auto parser = config_detail::make_parser(program);
    parser.parse(args);

    DriverOptions opts;
    if (parser.help_requested()) {
        opts.help = true;
        parser.print_help();
        return opts;
    }

    if (parser.has("filter")) {
        opts.run.filter = parser.get<std::string>("filter");
    }
    opts.run.min_duration = config_detail::seconds_to_ns(parser.get<double>("min_duration"));
    opts.run.min_runs = static_cast<std::uint64_t>(parser.get<int>("min_runs"));

    opts.log_level = Logger::parse_level(parser.get<std::string>("log_level"));
    if (parser.get<bool>("verbose") && opts.log_level > Logger::level::DEBUG) {
        opts.log_level = Logger::level::DEBUG;
    }
    if (parser.has("log_file")) {
        opts.log_file = parser.get<std::filesystem::path>("log_file");
    }
    return opts;
}

inline auto parse_driver_options(int argc, const char* const argv[]) -> DriverOptions {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_driver_options(argc > 0 ? argv[0] : "rangebench", args);
}

}  // namespace rangebench
