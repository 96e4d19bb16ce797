#pragma once

/**
 * @file runner.hxx
 * @brief The stopping-criterion loop: repeated timed runs of one body, and the per-entry driver
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../errors/errors.hxx"
#include "../input/input_range.hxx"
#include "../logger/logger.hxx"
#include "../reporting/csv_reporter.hxx"
#include "../timer/timer.hxx"
#include "config.hxx"
#include "filter.hxx"
#include "state.hxx"

namespace rangebench {

// ─────────────────────────────────────────────────────────────────────────────
// Body — one named callable under measurement
// ─────────────────────────────────────────────────────────────────────────────

template <typename T, typename Clock = std::chrono::steady_clock>
struct Body {
    std::string name;
    std::function<void(State<T, Clock>&)> fn;
};

// ─────────────────────────────────────────────────────────────────────────────
// RunStats — totals for one (entry, body, size) triple
// ─────────────────────────────────────────────────────────────────────────────

struct RunStats {
    std::uint64_t run_count = 0;
    std::chrono::nanoseconds total{0};

    /** Floor of total / run_count. */
    [[nodiscard]] auto mean_ns() const -> std::uint64_t {
        if (run_count == 0) {
            return 0;
        }
        return static_cast<std::uint64_t>(total.count()) / run_count;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// measure — run `body` until both thresholds hold
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Repeats `body` against a fresh copy of `prototype` and a fresh timer until
 * run_count >= config.min_runs AND total >= config.min_duration.
 *
 * The copy is made before the timer starts and destroyed after it stops, so
 * neither shows up in the measurement. A run whose body throws adds nothing
 * to the totals; the exception leaves measure() untouched.
 *
 * There is no cap besides the two thresholds; choose them sanely.
 */
template <typename Clock = std::chrono::steady_clock, typename T, typename Fn>
auto measure(Fn&& body, const T& prototype, std::uint64_t size, const RunConfig& config) -> RunStats {
    config.validate();

    RunStats stats;
    while (stats.run_count < config.min_runs || stats.total < config.min_duration) {
        basic_timer<Clock> timer;
        State<T, Clock> state(T(prototype), size, timer);

        timer.start();
        body(state);
        timer.pause();

        stats.total += timer.elapsed();
        ++stats.run_count;
    }
    return stats;
}

// ─────────────────────────────────────────────────────────────────────────────
// run_bodies — one entry: bodies in order, sizes ascending within each body
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Drives every (body, size) pair of one entry and reports each result as soon
 * as it is known.
 *
 * The filter is consulted before anything executes: a skipped triple costs
 * neither a body call nor, if no body wants that size, a generator call.
 * Generated states are shared by all bodies of the entry and released after
 * the last body has used them.
 *
 * @throws ConfigError for invalid thresholds, before any body runs.
 * @throws BenchmarkFailure when a body throws anything. Rows already reported
 *         stay reported.
 */
template <typename T, typename Clock = std::chrono::steady_clock>
void run_bodies(std::string_view entry_name, const std::vector<Body<T, Clock>>& bodies, InputSequence<T>& inputs, const RunConfig& config,
                Reporter& reporter) {
    config.validate();
    if (inputs.empty()) {
        RB_LOG_WARN << entry_name << ": " << inputs.range().to_string() << " is empty, nothing to run";
        return;
    }

    const bool trace = Logger::get_instance().enabled(Logger::level::DEBUG);

    for (std::size_t body_idx = 0; body_idx < bodies.size(); ++body_idx) {
        const auto& body = bodies[body_idx];
        const bool last_body = body_idx + 1 == bodies.size();

        for (std::size_t i = 0; i < inputs.count(); ++i) {
            const std::uint64_t size = inputs.size_at(i);
            std::string name = qualified_name(entry_name, body.name, size);
            if (!matches(name, config.filter)) {
                if (trace) {
                    RB_LOG_DEBUG << "skip " << name;
                }
                continue;
            }

            if (trace) {
                RB_LOG_DEBUG << "run  " << name;
            }
            RunStats stats;
            try {
                stats = measure<Clock>(body.fn, inputs.state_at(i), size, config);
            } catch (const BenchmarkFailure&) {
                inputs.release_all();
                throw;
            } catch (const std::exception& e) {
                inputs.release_all();
                RB_LOG_ERROR << name << ": body threw, aborting: " << e.what();
                throw BenchmarkFailure(name, e.what());
            } catch (...) {
                inputs.release_all();
                RB_LOG_ERROR << name << ": body threw a non-standard exception, aborting";
                throw BenchmarkFailure(name, "unknown exception");
            }

            if (trace) {
                RB_LOG_DEBUG << name << ": " << stats.run_count << " runs, " << stats.total.count() << " ns";
            }
            reporter.report(RunResult{
                .qualified_name = std::move(name),
                .mean_ns = stats.mean_ns(),
                .run_count = stats.run_count,
                .total_ns = static_cast<std::uint64_t>(stats.total.count()),
            });

            if (last_body) {
                inputs.release(i);
            }
        }
    }
    inputs.release_all();
}

}  // namespace rangebench
