#pragma once

/**
 * @file state.hxx
 * @brief Per-run state handle passed to benchmark bodies, plus optimizer barriers
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <cstdint>
#include <utility>

#include "../timer/timer.hxx"

namespace rangebench {

// ─────────────────────────────────────────────────────────────────────────────
// DoNotOptimize / ClobberMemory — keep the compiler from discarding the work
// under measurement. Same pattern as Google Benchmark / nanobench.
// ─────────────────────────────────────────────────────────────────────────────

#if defined(__GNUC__) || defined(__clang__)
template <typename T>
inline void DoNotOptimize(T const& val) {
    asm volatile("" : : "r,m"(val) : "memory");
}
template <typename T>
inline void DoNotOptimize(T& val) {
    asm volatile("" : "+r,m"(val) : : "memory");
}
inline void ClobberMemory() { asm volatile("" : : : "memory"); }
#else
template <typename T>
inline void DoNotOptimize(T const& val) {
    const volatile T* ptr = &val;
    (void)ptr;
}
inline void ClobberMemory() {}
#endif

// ─────────────────────────────────────────────────────────────────────────────
// State<T> — one run's private input plus the timer that measures it
//
//   void bm_pop(rangebench::State<std::vector<std::uint64_t>>& state) {
//       auto& vec = state.input();
//       while (!vec.empty()) {
//           vec.pop_back();
//       }
//   }
// ─────────────────────────────────────────────────────────────────────────────

template <typename T, typename Clock = std::chrono::steady_clock>
class State {
   public:
    State(T input, std::uint64_t size, basic_timer<Clock>& timer) : input_(std::move(input)), size_(size), timer_(timer) {}

    State(const State&) = delete;
    auto operator=(const State&) -> State& = delete;

    /** This run's copy of the input. Mutating it never leaks into other runs. */
    auto input() -> T& { return input_; }

    /** Moves the input out; the move itself is not measured. */
    auto take_input() -> T {
        const bool was_running = timer_.is_running();
        timer_.pause();
        T out = std::move(input_);
        if (was_running) {
            timer_.resume();
        }
        return out;
    }

    /** Raw input size of this run (equal to input() when no generator is set). */
    [[nodiscard]] auto size() const -> std::uint64_t { return size_; }

    void pause() { timer_.pause(); }
    void resume() { timer_.resume(); }

    [[nodiscard]] auto is_paused() const -> bool { return !timer_.is_running(); }
    [[nodiscard]] auto timer() const -> const basic_timer<Clock>& { return timer_; }

   private:
    T input_;
    std::uint64_t size_;
    basic_timer<Clock>& timer_;
};

}  // namespace rangebench
