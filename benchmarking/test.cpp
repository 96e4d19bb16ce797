#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../testing/manual_clock.hpp"
#include "../testing/test_main.hpp"
#include "bench_main.hpp"

using namespace rangebench;
using rangebench::testing::manual_clock;
using ns = std::chrono::nanoseconds;
using names_t = std::vector<std::string>;

namespace {

using manual_state = State<std::uint64_t, manual_clock>;

auto config(std::uint64_t min_runs, ns min_duration, std::optional<std::string> filter = std::nullopt) -> RunConfig {
    return RunConfig{.filter = std::move(filter), .min_duration = min_duration, .min_runs = min_runs};
}

auto names_of(const CollectingReporter& reporter) -> names_t {
    names_t out;
    for (const auto& result : reporter.results()) {
        out.push_back(result.qualified_name);
    }
    return out;
}

// Routes diagnostics away from the test output and returns what was logged.
auto quiet_log() -> std::ostringstream& {
    static std::ostringstream sink;
    sink.str("");
    Logger::get_instance().set_sink(sink);
    return sink;
}

// Copying costs clock time; none of it may show up in a measurement.
struct costly_copy {
    std::uint64_t value = 0;

    costly_copy() = default;
    costly_copy(const costly_copy& other) : value(other.value) { manual_clock::advance(ns{1000}); }
    auto operator=(const costly_copy&) -> costly_copy& = default;
};

void bm_noop(State<std::uint64_t>& state) { DoNotOptimize(state.input()); }

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Filter
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("filter")

TEST_CASE("qualified_name joins entry, body and size with slashes") { expect(qualified_name("range_bench", "pop", 1024)).to_equal(std::string("range_bench/pop/1024")); }

TEST_CASE("no filter matches everything") { expect(matches("a/range/1", std::nullopt)).to_be_true(); }

TEST_CASE("empty filter matches everything") { expect(matches("a/range/1", std::string{})).to_be_true(); }

TEST_CASE("filter \"gen\" keeps a/gen/1 and drops a/range/1") {
    std::optional<std::string> filter = "gen";
    expect(matches("a/gen/1", filter)).to_be_true();
    expect(matches("a/range/1", filter)).to_be_false();
}

TEST_CASE("filter may span name segments") { expect(matches("a/gen/1024", std::string("gen/10"))).to_be_true(); }

TEST_CASE("filter is case-sensitive") { expect(matches("a/Gen/1", std::string("gen"))).to_be_false(); }

// ─────────────────────────────────────────────────────────────────────────────
// State
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("state")

TEST_CASE("state exposes input and raw size") {
    basic_timer<manual_clock> timer;
    State<std::string, manual_clock> state(std::string("abc"), 3, timer);
    expect(state.input()).to_equal(std::string("abc"));
    expect(state.size()).to_equal(std::uint64_t{3});
}

TEST_CASE("pause() and resume() drive the run's timer") {
    manual_clock::reset();
    basic_timer<manual_clock> timer;
    manual_state state(7, 7, timer);
    timer.start();
    manual_clock::advance(ns{5});
    state.pause();
    expect(state.is_paused()).to_be_true();
    manual_clock::advance(ns{100});
    state.resume();
    manual_clock::advance(ns{5});
    expect(state.timer().elapsed()).to_equal(ns{10});
}

TEST_CASE("take_input() moves the input out without charging the move") {
    manual_clock::reset();
    basic_timer<manual_clock> timer;
    State<costly_copy, manual_clock> state(costly_copy{}, 1, timer);
    timer.start();
    auto owned = state.take_input();
    static_cast<void>(owned);
    expect(timer.is_running()).to_be_true();
    expect(timer.elapsed()).to_equal(ns{0});
}

TEST_CASE("take_input() while paused leaves the timer paused") {
    manual_clock::reset();
    basic_timer<manual_clock> timer;
    manual_state state(1, 1, timer);
    timer.start();
    state.pause();
    static_cast<void>(state.take_input());
    expect(state.is_paused()).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// measure — stopping criterion
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("stopping criterion")

TEST_CASE("duration dominates: 1000ns bodies, 10000ns minimum, 3 runs minimum") {
    manual_clock::reset();
    auto stats = measure<manual_clock>([](manual_state&) { manual_clock::advance(ns{1000}); }, std::uint64_t{1}, 1, config(3, ns{10000}));
    expect(stats.run_count).to_equal(std::uint64_t{10});
    expect(stats.total).to_equal(ns{10000});
    expect(stats.mean_ns()).to_equal(std::uint64_t{1000});
}

TEST_CASE("run count dominates for a fast body") {
    manual_clock::reset();
    auto stats = measure<manual_clock>([](manual_state&) { manual_clock::advance(ns{1}); }, std::uint64_t{1}, 1, config(8, ns{5}));
    expect(stats.run_count).to_equal(std::uint64_t{8});
    expect(stats.mean_ns()).to_equal(std::uint64_t{1});
}

TEST_CASE("a slow body keeps running past min_runs until the duration is reached") {
    manual_clock::reset();
    auto stats = measure<manual_clock>([](manual_state&) { manual_clock::advance(ns{300}); }, std::uint64_t{1}, 1, config(1, ns{1000}));
    expect(stats.run_count).to_equal(std::uint64_t{4});
    expect(stats.total).to_be_greater_or_equal(ns{1000});
}

TEST_CASE("zero-time bodies stop exactly at min_runs") {
    manual_clock::reset();
    int calls = 0;
    auto stats = measure<manual_clock>([&calls](manual_state&) { ++calls; }, std::uint64_t{1}, 1, config(5, ns{0}));
    expect(calls).to_equal(5);
    expect(stats.mean_ns()).to_equal(std::uint64_t{0});
}

TEST_CASE("mean is total divided by run count, rounded down") {
    manual_clock::reset();
    int run = 0;
    auto body = [&run](manual_state&) { manual_clock::advance(ns{run++ % 2 == 0 ? 3 : 4}); };
    auto stats = measure<manual_clock>(body, std::uint64_t{1}, 1, config(3, ns{0}));
    expect(stats.total).to_equal(ns{10});
    expect(stats.mean_ns()).to_equal(std::uint64_t{3});
}

TEST_CASE("paused intervals are excluded from the mean") {
    manual_clock::reset();
    auto body = [](manual_state& state) {
        state.pause();
        manual_clock::advance(ns{500});
        state.resume();
        manual_clock::advance(ns{10});
    };
    auto stats = measure<manual_clock>(body, std::uint64_t{1}, 1, config(4, ns{0}));
    expect(stats.mean_ns()).to_equal(std::uint64_t{10});
}

TEST_CASE("cloning the input is not measured") {
    manual_clock::reset();
    auto stats = measure<manual_clock>([](State<costly_copy, manual_clock>&) { manual_clock::advance(ns{20}); }, costly_copy{}, 1, config(3, ns{0}));
    expect(stats.total).to_equal(ns{60});
}

TEST_CASE("every run receives an independent copy of the input") {
    std::vector<int> prototype{1, 2, 3};
    std::vector<std::size_t> seen;
    auto body = [&seen](State<std::vector<int>, manual_clock>& state) {
        seen.push_back(state.input().size());
        state.input().clear();
    };
    static_cast<void>(measure<manual_clock>(body, prototype, 3, config(4, ns{0})));
    expect(seen).to_equal(std::vector<std::size_t>{3, 3, 3, 3});
    expect(prototype.size()).to_equal(std::size_t{3});
}

TEST_CASE("a throwing body propagates out of measure") {
    int run = 0;
    auto body = [&run](manual_state&) {
        if (++run == 3) {
            throw std::runtime_error("boom");
        }
    };
    expect_throws_with(std::runtime_error, "boom", static_cast<void>(measure<manual_clock>(body, std::uint64_t{1}, 1, config(5, ns{0}))));
    expect(run).to_equal(3);
}

TEST_CASE("min_runs of 0 is a configuration error") {
    expect_throws(ConfigError, static_cast<void>(measure<manual_clock>([](manual_state&) {}, std::uint64_t{1}, 1, config(0, ns{0}))));
}

TEST_CASE("RunStats with no runs has a zero mean") { expect(RunStats{}.mean_ns()).to_equal(std::uint64_t{0}); }

// ─────────────────────────────────────────────────────────────────────────────
// run_bodies — one entry
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("entry execution")

TEST_CASE("results come out body by body, sizes ascending") {
    quiet_log();
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"a", [](manual_state&) {}}, {"b", [](manual_state&) {}}};
    InputSequence<std::uint64_t> inputs({1, 4, 2}, identity_generator());
    CollectingReporter reporter;
    run_bodies<std::uint64_t, manual_clock>("e", bodies, inputs, config(1, ns{0}), reporter);
    expect(names_of(reporter)).to_equal(names_t{"e/a/1", "e/a/2", "e/a/4", "e/b/1", "e/b/2", "e/b/4"});
}

TEST_CASE("reported mean and run count match the measurement") {
    quiet_log();
    manual_clock::reset();
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"sized", [](manual_state& state) { manual_clock::advance(ns{state.input()}); }}};
    InputSequence<std::uint64_t> inputs({10, 100, 10}, identity_generator());
    CollectingReporter reporter;
    run_bodies<std::uint64_t, manual_clock>("e", bodies, inputs, config(2, ns{0}), reporter);
    expect(reporter.results().size()).to_equal(std::size_t{2});
    expect(reporter.results()[0]).to_equal(RunResult{.qualified_name = "e/sized/10", .mean_ns = 10, .run_count = 2, .total_ns = 20});
    expect(reporter.results()[1]).to_equal(RunResult{.qualified_name = "e/sized/100", .mean_ns = 100, .run_count = 2, .total_ns = 200});
}

TEST_CASE("filtered-out triples never execute") {
    quiet_log();
    int gen_calls = 0;
    int range_calls = 0;
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"gen", [&gen_calls](manual_state&) { ++gen_calls; }},
                                                         {"range", [&range_calls](manual_state&) { ++range_calls; }}};
    InputSequence<std::uint64_t> inputs({1, 1, 2}, identity_generator());
    CollectingReporter reporter;
    run_bodies<std::uint64_t, manual_clock>("a", bodies, inputs, config(3, ns{0}, "gen"), reporter);
    expect(names_of(reporter)).to_equal(names_t{"a/gen/1"});
    expect(gen_calls).to_equal(3);
    expect(range_calls).to_equal(0);
}

TEST_CASE("sizes nobody wants are never generated") {
    quiet_log();
    std::vector<std::uint64_t> generated;
    InputSequence<std::uint64_t> inputs({1, 4, 2}, [&generated](std::uint64_t n) {
        generated.push_back(n);
        return n;
    });
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"x", [](manual_state&) {}}};
    CollectingReporter reporter;
    run_bodies<std::uint64_t, manual_clock>("a", bodies, inputs, config(1, ns{0}, "/4"), reporter);
    expect(generated).to_equal(std::vector<std::uint64_t>{4});
}

TEST_CASE("bodies of one entry share a single generated state per size") {
    quiet_log();
    int calls = 0;
    InputSequence<std::uint64_t> inputs({1, 8, 2}, [&calls](std::uint64_t n) {
        ++calls;
        return n;
    });
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"x", [](manual_state&) {}}, {"y", [](manual_state&) {}}, {"z", [](manual_state&) {}}};
    CollectingReporter reporter;
    run_bodies<std::uint64_t, manual_clock>("a", bodies, inputs, config(2, ns{0}), reporter);
    expect(calls).to_equal(4);
    expect(reporter.results().size()).to_equal(std::size_t{12});
    for (std::size_t i = 0; i < inputs.count(); ++i) {
        expect(inputs.is_materialized(i)).to_be_false();
    }
}

TEST_CASE("a failing body aborts the entry and names the triple") {
    quiet_log();
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"b",
                                                           [](manual_state& state) {
                                                               if (state.size() == 2) {
                                                                   throw std::runtime_error("boom");
                                                               }
                                                           }},
                                                          {"never", [](manual_state&) { throw std::logic_error("must not run"); }}};
    InputSequence<std::uint64_t> inputs({1, 4, 2}, identity_generator());
    CollectingReporter reporter;
    std::string qualified;
    try {
        run_bodies<std::uint64_t, manual_clock>("e", bodies, inputs, config(1, ns{0}), reporter);
    } catch (const BenchmarkFailure& e) {
        qualified = e.qualified_name;
        expect(std::string(e.what())).to_contain("boom");
    }
    expect(qualified).to_equal(std::string("e/b/2"));
    expect(names_of(reporter)).to_equal(names_t{"e/b/1"});
    expect(inputs.is_materialized(0)).to_be_false();
}

TEST_CASE("a body throwing a non-standard exception becomes a BenchmarkFailure") {
    auto& log = quiet_log();
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"b", [](manual_state&) { throw 42; }}};
    InputSequence<std::uint64_t> inputs({1, 4, 2}, identity_generator());
    CollectingReporter reporter;
    std::string qualified;
    try {
        run_bodies<std::uint64_t, manual_clock>("e", bodies, inputs, config(1, ns{0}), reporter);
    } catch (const BenchmarkFailure& e) {
        qualified = e.qualified_name;
        expect(std::string(e.what())).to_contain("unknown exception");
    }
    expect(qualified).to_equal(std::string("e/b/1"));
    expect(reporter.results().empty()).to_be_true();
    expect(inputs.is_materialized(0)).to_be_false();
    expect(log.str()).to_contain("e/b/1: body threw a non-standard exception");
}

TEST_CASE("per-triple debug lines appear only at DEBUG level") {
    auto& log = quiet_log();
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"a", [](manual_state&) {}}};
    CollectingReporter reporter;

    Logger::get_instance().set_min_level(Logger::level::DEBUG);
    InputSequence<std::uint64_t> traced({1, 2, 2}, identity_generator());
    run_bodies<std::uint64_t, manual_clock>("e", bodies, traced, config(1, ns{0}, std::string("/1")), reporter);
    Logger::get_instance().set_min_level(Logger::level::WARNING);
    expect(log.str()).to_contain("run  e/a/1");
    expect(log.str()).to_contain("skip e/a/2");

    log.str("");
    InputSequence<std::uint64_t> quiet({1, 2, 2}, identity_generator());
    run_bodies<std::uint64_t, manual_clock>("e", bodies, quiet, config(1, ns{0}), reporter);
    expect(log.str()).not_to_contain("run  ");
}

TEST_CASE("an empty range reports nothing and logs a warning") {
    auto& log = quiet_log();
    std::vector<Body<std::uint64_t, manual_clock>> bodies{{"x", [](manual_state&) { throw std::logic_error("must not run"); }}};
    InputSequence<std::uint64_t> inputs({8, 4, 2}, identity_generator());
    CollectingReporter reporter;
    run_bodies<std::uint64_t, manual_clock>("e", bodies, inputs, config(1, ns{0}), reporter);
    expect(reporter.results().empty()).to_be_true();
    expect(log.str()).to_contain("empty");
}

// ─────────────────────────────────────────────────────────────────────────────
// Benchmark builder
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("benchmark builder")

TEST_CASE("with_name starts from the default range") {
    auto bench = Benchmark<>::with_name("x");
    expect(bench.range().lower).to_equal(std::uint64_t{1});
    expect(bench.range().upper).to_equal(std::uint64_t{1} << 20);
    expect(bench.range().multiplier).to_equal(std::uint64_t{2});
}

TEST_CASE("bound setters change one field each") {
    auto bench = Benchmark<>::with_name("x").with_lower_bound(3).with_upper_bound(300).with_mul(10);
    expect(bench.range().to_string()).to_equal(std::string("range(3, 300, 10)"));
}

TEST_CASE("RB_BENCH names a body after its function") {
    auto bench = Benchmark<>::with_name("x").with_bench(RB_BENCH(bm_noop));
    expect(bench.body_names()).to_equal(names_t{"bm_noop"});
}

TEST_CASE("names containing ',' or '/' are rejected") {
    expect_throws(ConfigError, Benchmark<>::with_name("a,b"));
    expect_throws(ConfigError, Benchmark<>::with_name("a/b"));
    expect_throws(ConfigError, Benchmark<>::with_name(""));
    expect_throws(ConfigError, Benchmark<>::with_name("ok").with_bench("bad/body", bm_noop));
}

TEST_CASE("an entry with no bodies fails validation") { expect_throws_with(ConfigError, "no bodies", Benchmark<>::with_name("lonely").validate()); }

TEST_CASE("with_generator after with_bench is rejected") {
    auto bench = Benchmark<>::with_name("x").with_bench("b", bm_noop);
    expect_throws(ConfigError, static_cast<void>(bench.with_generator([](std::uint64_t n) { return std::to_string(n); })));
}

TEST_CASE("generators compose and feed the bodies") {
    quiet_log();
    std::vector<std::size_t> seen;
    auto bench = Benchmark<>::with_name("g")
                     .with_range(1, 100, 10)
                     .with_generator([](std::uint64_t n) { return std::vector<int>(n, 0); })
                     .with_generator([](const std::vector<int>& v) { return std::string(v.size(), '#'); })
                     .with_bench("len", [&seen](State<std::string>& state) { seen.push_back(state.input().size()); });
    CollectingReporter reporter;
    bench.run(config(1, ns{0}), reporter);
    expect(seen).to_equal(std::vector<std::size_t>{1, 10, 100});
    expect(names_of(reporter)).to_equal(names_t{"g/len/1", "g/len/10", "g/len/100"});
}

TEST_CASE("run() prefixes range errors with the entry name") {
    auto bench = Benchmark<>::with_name("bad_mul").with_range(1, 10, 1).with_bench("b", bm_noop);
    CollectingReporter reporter;
    expect_throws_with(ConfigError, "bad_mul", bench.run(config(1, ns{0}), reporter));
}

// ─────────────────────────────────────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("registry")

TEST_CASE("entries run in registration order and finish() is called once") {
    quiet_log();
    Registry registry;
    registry.add(Benchmark<>::with_name("second").with_range(2, 2, 2).with_bench("b", bm_noop));
    registry.add(Benchmark<>::with_name("first").with_range(1, 1, 2).with_bench("b", bm_noop));
    CollectingReporter reporter;
    registry.run_all(config(1, ns{0}), reporter);
    expect(names_of(reporter)).to_equal(names_t{"second/b/2", "first/b/1"});
    expect(reporter.finished()).to_be_true();
}

TEST_CASE("each triple is invoked exactly min_runs times when min_duration is zero") {
    quiet_log();
    int calls = 0;
    Registry registry;
    registry.add(Benchmark<>::with_name("count").with_range(1, 4, 2).with_bench("b", [&calls](State<std::uint64_t>&) { ++calls; }));
    CollectingReporter reporter;
    registry.run_all(config(5, ns{0}), reporter);
    expect(calls).to_equal(15);
    for (const auto& result : reporter.results()) {
        expect(result.run_count).to_equal(std::uint64_t{5});
    }
}

TEST_CASE("a bad entry anywhere stops the run before any body executes") {
    quiet_log();
    int calls = 0;
    Registry registry;
    registry.add(Benchmark<>::with_name("good").with_range(1, 1, 2).with_bench("b", [&calls](State<std::uint64_t>&) { ++calls; }));
    registry.add(Benchmark<>::with_name("overflow").with_range(3, std::numeric_limits<std::uint64_t>::max(), 2).with_bench("b", bm_noop));
    CollectingReporter reporter;
    expect_throws_with(ConfigError, "overflow", registry.run_all(config(1, ns{0}), reporter));
    expect(calls).to_equal(0);
    expect(reporter.finished()).to_be_false();
}

TEST_CASE("a null entry cannot be registered") {
    Registry registry;
    expect_throws(ConfigError, registry.add(std::unique_ptr<BenchmarkEntry>{}));
    expect(registry.empty()).to_be_true();
}

TEST_CASE("an empty registry still finishes the reporter") {
    Registry registry;
    CollectingReporter reporter;
    registry.run_all(config(1, ns{0}), reporter);
    expect(reporter.finished()).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// Driver options
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("driver options")

TEST_CASE("defaults: 1s, 8 runs, no filter, warnings only") {
    auto opts = parse_driver_options("bench", {});
    expect(opts.run.filter.has_value()).to_be_false();
    expect(opts.run.min_duration).to_equal(ns{1'000'000'000});
    expect(opts.run.min_runs).to_equal(std::uint64_t{8});
    expect(opts.log_level == Logger::level::WARNING).to_be_true();
    expect(opts.help).to_be_false();
}

TEST_CASE("short flags set filter, thresholds and verbosity") {
    auto opts = parse_driver_options("bench", {"-f", "gen", "-d", "0.25", "-r", "3", "-v"});
    expect(*opts.run.filter).to_equal(std::string("gen"));
    expect(opts.run.min_duration).to_equal(ns{250'000'000});
    expect(opts.run.min_runs).to_equal(std::uint64_t{3});
    expect(opts.log_level == Logger::level::DEBUG).to_be_true();
}

TEST_CASE("--log_level picks the diagnostic threshold") {
    auto opts = parse_driver_options("bench", {"--log_level", "error"});
    expect(opts.log_level == Logger::level::ERROR).to_be_true();
    expect_throws(cli::ParseError, parse_driver_options("bench", {"--log_level", "chatty"}));
}

TEST_CASE("min_runs below 1 is rejected at parse time") { expect_throws(cli::ParseError, parse_driver_options("bench", {"--min_runs", "0"})); }

TEST_CASE("negative min_duration is rejected at parse time") {
    expect_throws(cli::ParseError, parse_driver_options("bench", {"--min_duration", "-1"}));
}

TEST_CASE("unknown flags are rejected") { expect_throws(cli::ParseError, parse_driver_options("bench", {"--iterations", "3"})); }

TEST_CASE("a TOML file supplies values and the command line overrides them") {
    auto path = std::filesystem::temp_directory_path() / "rangebench_driver_options_test.toml";
    {
        std::ofstream file(path);
        file << "[run]\n"
             << "filter = \"vector\"   # only vectors\n"
             << "min_duration = 0.5\n"
             << "min_runs = 16\n";
    }
    auto opts = parse_driver_options("bench", {"--config", path.string(), "-r", "2"});
    std::filesystem::remove(path);
    expect(*opts.run.filter).to_equal(std::string("vector"));
    expect(opts.run.min_duration).to_equal(ns{500'000'000});
    expect(opts.run.min_runs).to_equal(std::uint64_t{2});
}

TEST_CASE("TOML errors carry file and line") {
    auto path = std::filesystem::temp_directory_path() / "rangebench_bad_options_test.toml";
    {
        std::ofstream file(path);
        file << "min_runs = 4\n"
             << "warmup = 3\n";
    }
    std::string message;
    try {
        static_cast<void>(parse_driver_options("bench", {"-C", path.string()}));
    } catch (const cli::ParseError& e) {
        message = e.what();
    }
    std::filesystem::remove(path);
    expect(message).to_contain(":2:");
    expect(message).to_contain("warmup");
}

TEST_CASE("--help is reported, not acted on") {
    std::ostringstream discard;
    auto* old = std::cerr.rdbuf(discard.rdbuf());
    auto opts = parse_driver_options("bench", {"--help"});
    std::cerr.rdbuf(old);
    expect(opts.help).to_be_true();
    expect(discard.str()).to_contain("--min_runs");
}

TEST_CASE("seconds convert to whole nanoseconds") {
    expect(config_detail::seconds_to_ns(1.5)).to_equal(ns{1'500'000'000});
    expect(config_detail::seconds_to_ns(0.0)).to_equal(ns{0});
}

TEST_CASE("min_duration too large for nanoseconds is rejected") {
    expect_throws_with(cli::ParseError, "--min_duration", parse_driver_options("bench", {"-d", "1e10"}));
    expect_throws(cli::ParseError, static_cast<void>(config_detail::seconds_to_ns(9.3e9)));
    expect(config_detail::seconds_to_ns(9.2e9) > ns{0}).to_be_true();
}

TEST_CASE("non-finite min_duration is rejected") {
    expect_throws(cli::ParseError, parse_driver_options("bench", {"-d", "inf"}));
    expect_throws(cli::ParseError, parse_driver_options("bench", {"-d", "nan"}));
    expect_throws(cli::ParseError, static_cast<void>(config_detail::seconds_to_ns(std::numeric_limits<double>::quiet_NaN())));
    expect_throws(cli::ParseError, static_cast<void>(config_detail::seconds_to_ns(-std::numeric_limits<double>::infinity())));
}

// ─────────────────────────────────────────────────────────────────────────────
// run_main — the executable's behavior end to end
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("run_main")

TEST_CASE("prints the header then one row per triple") {
    quiet_log();
    Registry registry;
    registry.add(Benchmark<>::with_name("e").with_range(1, 2, 2).with_bench("b", bm_noop));
    std::ostringstream out;
    int status = run_main("bench", {"-d", "0", "-r", "1"}, registry, out);
    expect(status).to_equal(static_cast<int>(STATUS_OK));

    std::istringstream lines(out.str());
    names_t rows;
    for (std::string line; std::getline(lines, line);) {
        rows.push_back(line.substr(0, line.find(',')));
    }
    expect(rows).to_equal(names_t{"Name", "e/b/1", "e/b/2"});
}

TEST_CASE("a filter that matches nothing still prints the header") {
    quiet_log();
    Registry registry;
    registry.add(Benchmark<>::with_name("e").with_range(1, 2, 2).with_bench("b", bm_noop));
    std::ostringstream out;
    int status = run_main("bench", {"-f", "zzz", "-d", "0", "-r", "1"}, registry, out);
    expect(status).to_equal(static_cast<int>(STATUS_OK));
    expect(out.str()).to_equal(std::string("Name,Time (ns)\n"));
}

TEST_CASE("a failing body exits non-zero and keeps the rows already written") {
    auto& log = quiet_log();
    Registry registry;
    registry.add(Benchmark<>::with_name("ok").with_range(1, 1, 2).with_bench("b", bm_noop));
    registry.add(Benchmark<>::with_name("bad").with_range(1, 1, 2).with_bench("b", [](State<std::uint64_t>&) { throw std::runtime_error("kaput"); }));
    std::ostringstream out;
    int status = run_main("bench", {"-d", "0", "-r", "1"}, registry, out);
    expect(status).to_equal(static_cast<int>(STATUS_FAILED));
    expect(out.str()).to_contain("ok/b/1,");
    expect(out.str()).not_to_contain("bad/b/1");
    expect(log.str()).to_contain("kaput");
}

TEST_CASE("a body throwing a non-standard exception exits non-zero") {
    auto& log = quiet_log();
    Registry registry;
    registry.add(Benchmark<>::with_name("odd").with_range(1, 1, 2).with_bench("b", [](State<std::uint64_t>&) { throw 42; }));
    std::ostringstream out;
    int status = run_main("bench", {"-d", "0", "-r", "1"}, registry, out);
    expect(status).to_equal(static_cast<int>(STATUS_FAILED));
    expect(out.str()).not_to_contain("odd/b/1,");
    expect(log.str()).to_contain("odd/b/1: body threw a non-standard exception");
}

TEST_CASE("an unrepresentable min_duration is a usage error") {
    quiet_log();
    int calls = 0;
    Registry registry;
    registry.add(Benchmark<>::with_name("e").with_range(1, 1, 2).with_bench("b", [&calls](State<std::uint64_t>&) { ++calls; }));
    std::ostringstream out;
    std::ostringstream discard;
    auto* old = std::cerr.rdbuf(discard.rdbuf());
    int status = run_main("bench", {"-d", "nan"}, registry, out);
    std::cerr.rdbuf(old);
    expect(status).to_equal(static_cast<int>(STATUS_USAGE));
    expect(calls).to_equal(0);
}

TEST_CASE("a bad flag is a usage error and runs nothing") {
    quiet_log();
    int calls = 0;
    Registry registry;
    registry.add(Benchmark<>::with_name("e").with_range(1, 1, 2).with_bench("b", [&calls](State<std::uint64_t>&) { ++calls; }));
    std::ostringstream out;
    std::ostringstream discard;
    auto* old = std::cerr.rdbuf(discard.rdbuf());
    int status = run_main("bench", {"--bogus"}, registry, out);
    std::cerr.rdbuf(old);
    expect(status).to_equal(static_cast<int>(STATUS_USAGE));
    expect(calls).to_equal(0);
    expect(out.str().empty()).to_be_true();
}
