#pragma once

// A clock that only moves when a test says so. Plug it into basic_timer,
// State or measure() to get exact, repeatable durations.
//
//   manual_clock::reset();
//   rangebench::basic_timer<manual_clock> t;
//   t.start();
//   manual_clock::advance(std::chrono::nanoseconds{250});
//   t.elapsed();  // 250ns

#include <chrono>

namespace rangebench::testing {

struct manual_clock {
    using rep = std::chrono::nanoseconds::rep;
    using period = std::chrono::nanoseconds::period;
    using duration = std::chrono::nanoseconds;
    using time_point = std::chrono::time_point<manual_clock, duration>;
    static constexpr bool is_steady = true;

    static auto now() -> time_point { return time_point{current()}; }

    static void advance(duration step) { current() += step; }

    static void reset() { current() = duration::zero(); }

   private:
    static auto current() -> duration& {
        static duration value{0};
        return value;
    }
};

}  // namespace rangebench::testing
