#include "../testing/manual_clock.hpp"
#include "../testing/test_main.hpp"
#include "timer.hxx"

using rangebench::testing::manual_clock;
using ns = std::chrono::nanoseconds;
using test_timer = rangebench::basic_timer<manual_clock>;

// ─────────────────────────────────────────────────────────────────────────────
// Running state
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("timer state")

TEST_CASE("a fresh timer is paused with zero elapsed time") {
    manual_clock::reset();
    test_timer t;
    expect(t.is_running()).to_be_false();
    expect(t.elapsed_ns()).to_equal(0ULL);
}

TEST_CASE("start() enters the running state") {
    manual_clock::reset();
    test_timer t;
    t.start();
    expect(t.is_running()).to_be_true();
}

TEST_CASE("elapsed() includes the open interval while running") {
    manual_clock::reset();
    test_timer t;
    t.start();
    manual_clock::advance(ns{40});
    expect(t.elapsed()).to_equal(ns{40});
    manual_clock::advance(ns{2});
    expect(t.elapsed()).to_equal(ns{42});
}

TEST_CASE("start() zeroes previously accumulated time") {
    manual_clock::reset();
    test_timer t;
    t.start();
    manual_clock::advance(ns{100});
    t.pause();
    t.start();
    manual_clock::advance(ns{5});
    expect(t.elapsed()).to_equal(ns{5});
}

// ─────────────────────────────────────────────────────────────────────────────
// Pause / resume
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("timer pause and resume")

TEST_CASE("paused time is excluded from elapsed") {
    manual_clock::reset();
    test_timer t;
    t.start();
    manual_clock::advance(ns{10});
    t.pause();
    manual_clock::advance(ns{1000});
    t.resume();
    manual_clock::advance(ns{20});
    t.pause();
    expect(t.elapsed()).to_equal(ns{30});
}

TEST_CASE("elapsed is the exact sum of every running interval") {
    manual_clock::reset();
    test_timer t;
    t.start();
    for (int i = 1; i <= 4; ++i) {
        manual_clock::advance(ns{i});
        t.pause();
        manual_clock::advance(ns{500});
        t.resume();
    }
    t.pause();
    expect(t.elapsed_ns()).to_equal(10ULL);
}

TEST_CASE("elapsed does not move while paused") {
    manual_clock::reset();
    test_timer t;
    t.start();
    manual_clock::advance(ns{7});
    t.pause();
    auto frozen = t.elapsed();
    manual_clock::advance(ns{700});
    expect(t.elapsed()).to_equal(frozen);
}

TEST_CASE("pause() while paused is a no-op") {
    manual_clock::reset();
    test_timer t;
    t.start();
    manual_clock::advance(ns{3});
    t.pause();
    manual_clock::advance(ns{9});
    t.pause();
    expect(t.is_running()).to_be_false();
    expect(t.elapsed()).to_equal(ns{3});
}

TEST_CASE("resume() while running is a no-op") {
    manual_clock::reset();
    test_timer t;
    t.start();
    manual_clock::advance(ns{6});
    t.resume();
    manual_clock::advance(ns{4});
    expect(t.is_running()).to_be_true();
    expect(t.elapsed()).to_equal(ns{10});
}

TEST_CASE("pause() before start() leaves the timer at zero") {
    manual_clock::reset();
    test_timer t;
    t.pause();
    manual_clock::advance(ns{50});
    expect(t.elapsed_ns()).to_equal(0ULL);
}

// ─────────────────────────────────────────────────────────────────────────────
// Real clock
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("steady clock timer")

TEST_CASE("Timer measures a non-negative, monotonic duration") {
    rangebench::Timer t;
    t.start();
    volatile std::uint64_t sink = 0;
    for (std::uint64_t i = 0; i < 10000; ++i) {
        sink = sink + i;
    }
    auto first = t.elapsed();
    auto second = t.elapsed();
    t.pause();
    expect(first.count()).to_be_greater_or_equal(0L);
    expect(second).to_be_greater_or_equal(first);
    expect(t.elapsed()).to_be_greater_or_equal(second);
}
