#pragma once

/**
 * @file timer.hxx
 * @brief Pausable stopwatch that measures the active time of a single benchmark run
 * @version 3.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <concepts>
#include <cstdint>

namespace rangebench {

// ─────────────────────────────────────────────────────────────────────────────
// Internal helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace timer_detail {

// Any clock whose now() yields a time_point we can subtract and cast to ns.
template <typename C>
concept MonotonicClock = requires {
    typename C::time_point;
    typename C::duration;
    { C::now() } -> std::same_as<typename C::time_point>;
};

template <typename Dur>
constexpr auto to_ns(Dur dur) -> std::chrono::nanoseconds {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(dur);
}

}  // namespace timer_detail

// ─────────────────────────────────────────────────────────────────────────────
// basic_timer
// ─────────────────────────────────────────────────────────────────────────────

/**
 * A single-threaded stopwatch with pause/resume.
 *
 * Active time is the sum of the intervals spent in the running state. A fresh
 * run calls start(), which zeroes the accumulator and arms the clock. Bodies
 * may then bracket setup work with pause()/resume(); repeated pauses or
 * resumes are ignored rather than reported.
 *
 * The clock is a template parameter so tests can substitute a manual clock.
 * Thread safety: not thread-safe. Each instance is owned by one run.
 */
template <timer_detail::MonotonicClock Clock>
class basic_timer {
   public:
    using clock = Clock;
    using time_point = typename Clock::time_point;

    basic_timer() = default;

    /** Zeroes the accumulated time and enters the running state. */
    void start() {
        elapsed_ = std::chrono::nanoseconds::zero();
        running_ = true;
        resumed_at_ = clock::now();
    }

    /** Commits the open interval. No-op when already paused. */
    void pause() {
        if (!running_) {
            return;
        }
        elapsed_ += timer_detail::to_ns(clock::now() - resumed_at_);
        running_ = false;
    }

    /** Re-opens an interval. No-op when already running. */
    void resume() {
        if (running_) {
            return;
        }
        running_ = true;
        resumed_at_ = clock::now();
    }

    [[nodiscard]] auto is_running() const -> bool { return running_; }

    /** Committed time plus the open interval, if any. Safe to call mid-run. */
    [[nodiscard]] auto elapsed() const -> std::chrono::nanoseconds {
        auto total = elapsed_;
        if (running_) {
            total += timer_detail::to_ns(clock::now() - resumed_at_);
        }
        return total;
    }

    [[nodiscard]] auto elapsed_ns() const -> std::uint64_t { return static_cast<std::uint64_t>(elapsed().count()); }

   private:
    bool running_ = false;
    std::chrono::nanoseconds elapsed_{0};
    time_point resumed_at_{};
};

using Timer = basic_timer<std::chrono::steady_clock>;

}  // namespace rangebench
