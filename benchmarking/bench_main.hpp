#pragma once

// Process entry point for benchmark executables.
//
// Write a function that fills a registry, then hand it to RB_BENCH_MAIN in
// exactly ONE .cpp file:
//
//   static void register_benchmarks(rangebench::Registry& registry) {
//       registry.add(rangebench::Benchmark<>::with_name("range_bench")
//                        .with_range(1 << 10, 1 << 20, 4)
//                        .with_bench(RB_BENCH(bm_vector_range)));
//   }
//
//   RB_BENCH_MAIN(register_benchmarks)
//
// The executable accepts --filter/-f, --min_duration/-d, --min_runs/-r,
// --verbose/-v, --log_level/-l, --log_file and --config/-C (see config.hxx),
// prints CSV on stdout and diagnostics on stderr.

#include <exception>
#include <functional>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "../argparser/argparser.hxx"
#include "../errors/errors.hxx"
#include "../logger/logger.hxx"
#include "../reporting/csv_reporter.hxx"
#include "benchmark.hxx"
#include "config.hxx"

namespace rangebench {

enum exit_status : int { STATUS_OK = 0, STATUS_FAILED = 1, STATUS_USAGE = 2 };

/** Runs `registry` as configured by `args`, writing CSV to `out`. Returns the exit status. */
inline auto run_main(const std::string& program, const std::vector<std::string>& args, const Registry& registry, std::ostream& out) -> int {
    DriverOptions opts;
    try {
        opts = parse_driver_options(program, args);
    } catch (const cli::ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        config_detail::make_parser(program).print_help();
        return STATUS_USAGE;
    }
    if (opts.help) {
        return STATUS_OK;
    }

    try {
        Logger::get_instance().initialize(opts.log_level, opts.log_file.string());
    } catch (const std::runtime_error& e) {
        // already initialized by the embedding program, or unwritable log file
        Logger::get_instance().set_min_level(opts.log_level);
        RB_LOG_WARN << e.what();
    }

    CsvReporter reporter(out);
    try {
        registry.run_all(opts.run, reporter);
    } catch (const ConfigError& e) {
        RB_LOG_ERROR << "configuration error: " << e.what();
        return STATUS_FAILED;
    } catch (const BenchmarkFailure& e) {
        RB_LOG_ERROR << e.what();
        return STATUS_FAILED;
    }

    RB_LOG_SUCCESS << reporter.rows() << " results";
    return STATUS_OK;
}

inline auto run_main(int argc, char* argv[], const std::function<void(Registry&)>& register_benchmarks) -> int {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    Registry registry;
    try {
        register_benchmarks(registry);
    } catch (const ConfigError& e) {
        RB_LOG_ERROR << "configuration error: " << e.what();
        return STATUS_FAILED;
    }
    return run_main(argc > 0 ? argv[0] : "rangebench", args, registry, std::cout);
}

}  // namespace rangebench

#define RB_BENCH_MAIN(register_fn) \
    auto main(int argc, char* argv[]) -> int { return ::rangebench::run_main(argc, argv, (register_fn)); }
