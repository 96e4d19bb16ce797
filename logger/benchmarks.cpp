/**
 * @file benchmarks.cpp
 * @brief Cost of a log call: dropped below the level vs formatted and written.
 *
 * Runs on the benchmark engine itself; the input size is the number of log
 * calls per run. Output goes to a null stream buffer so terminal I/O does not
 * dominate.
 *
 *   ./rangebench_logger_benchmarks -d 0.2 | ./rangebench_transpose
 */

#include <cstdint>
#include <iostream>
#include <ostream>
#include <streambuf>
#include <string>

#include "../benchmarking/bench_main.hpp"
#include "logger.hxx"

using rangebench::Logger;
using rangebench::State;

namespace {

// ── /dev/null sink ────────────────────────────────────────────────────────────

struct NullBuf : std::streambuf {
    auto overflow(int c) -> int override { return c; }
    auto xsputn(const char*, std::streamsize n) -> std::streamsize override { return n; }
};

const std::string MSG = "request processed: id=12345 status=200 latency=42ms";

// Swaps the logger onto the null sink for the duration of one run.
class null_sink_scope {
   public:
    explicit null_sink_scope(Logger::level lvl) : previous_(Logger::get_instance().min_level()) {
        Logger::get_instance().set_sink(out_);
        Logger::get_instance().set_min_level(lvl);
    }

    null_sink_scope(const null_sink_scope&) = delete;
    auto operator=(const null_sink_scope&) -> null_sink_scope& = delete;

    ~null_sink_scope() {
        Logger::get_instance().set_min_level(previous_);
        Logger::get_instance().set_sink(std::cerr);
    }

   private:
    NullBuf buf_;
    std::ostream out_{&buf_};
    Logger::level previous_;
};

// ── Bodies ────────────────────────────────────────────────────────────────────

void bm_baseline(State<std::uint64_t>& state) {
    volatile std::uint64_t sink = 0;
    for (std::uint64_t i = 0; i < state.input(); ++i) {
        sink = sink + i;
    }
}

void bm_filtered(State<std::uint64_t>& state) {
    state.pause();
    null_sink_scope scope(Logger::level::WARNING);
    state.resume();
    for (std::uint64_t i = 0; i < state.input(); ++i) {
        RB_LOG_DEBUG << MSG << " #" << i;
    }
    state.pause();
}

void bm_emitted(State<std::uint64_t>& state) {
    state.pause();
    null_sink_scope scope(Logger::level::DEBUG);
    state.resume();
    for (std::uint64_t i = 0; i < state.input(); ++i) {
        RB_LOG_DEBUG << MSG << " #" << i;
    }
    state.pause();
}

void bm_emitted_string(State<std::uint64_t>& state) {
    state.pause();
    null_sink_scope scope(Logger::level::DEBUG);
    state.resume();
    for (std::uint64_t i = 0; i < state.input(); ++i) {
        Logger::get_instance().debug(MSG);
    }
    state.pause();
}

void register_benchmarks(rangebench::Registry& registry) {
    registry.add(rangebench::Benchmark<>::with_name("logger")
                     .with_range(1, 10'000, 10)
                     .with_bench(RB_BENCH(bm_baseline))
                     .with_bench(RB_BENCH(bm_filtered))
                     .with_bench(RB_BENCH(bm_emitted))
                     .with_bench(RB_BENCH(bm_emitted_string)));
}

}  // namespace

RB_BENCH_MAIN(register_benchmarks)
