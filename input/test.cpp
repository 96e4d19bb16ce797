#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "../testing/test_main.hpp"
#include "input_range.hxx"

using rangebench::ConfigError;
using rangebench::InputRange;
using rangebench::InputSequence;
using sizes_t = std::vector<std::uint64_t>;

// ─────────────────────────────────────────────────────────────────────────────
// Range expansion
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("range expansion")

TEST_CASE("1024..4096 by 4 yields 1024 and 4096") { expect(InputRange{1024, 4096, 4}.sizes()).to_equal(sizes_t{1024, 4096}); }

TEST_CASE("a single-point range yields one size") { expect(InputRange{10, 10, 2}.sizes()).to_equal(sizes_t{10}); }

TEST_CASE("upper bound that is not a power stops at the last value below it") {
    expect(InputRange{3, 100, 3}.sizes()).to_equal(sizes_t{3, 9, 27, 81});
}

TEST_CASE("lower above upper yields an empty range") { expect(InputRange{8, 4, 2}.sizes().empty()).to_be_true(); }

TEST_CASE("default range is 1..2^20 by 2") {
    auto sizes = InputRange{}.sizes();
    expect(sizes.size()).to_equal(std::size_t{21});
    expect(sizes.front()).to_equal(std::uint64_t{1});
    expect(sizes.back()).to_equal(std::uint64_t{1} << 20);
}

TEST_CASE("sizes are strictly increasing and bounded") {
    InputRange range{5, 1'000'000, 7};
    auto sizes = range.sizes();
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        expect(sizes[i]).to_be_greater_or_equal(range.lower);
        expect(sizes[i]).to_be_less_or_equal(range.upper);
        if (i > 0) {
            expect(sizes[i]).to_equal(sizes[i - 1] * range.multiplier);
        }
    }
}

TEST_CASE("an upper bound reached exactly at the top of u64 does not overflow") {
    constexpr std::uint64_t TOP = std::uint64_t{1} << 63;
    auto sizes = InputRange{TOP / 4, TOP, 2}.sizes();
    expect(sizes).to_equal(sizes_t{TOP / 4, TOP / 2, TOP});
}

// ─────────────────────────────────────────────────────────────────────────────
// Invalid ranges
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("invalid ranges")

TEST_CASE("multiplier of 1 is rejected") { expect_throws_with(ConfigError, "multiplier", static_cast<void>(InputRange{1, 10, 1}.sizes())); }

TEST_CASE("multiplier of 0 is rejected") { expect_throws(ConfigError, InputRange{1, 10, 0}.validate()); }

TEST_CASE("lower bound of 0 is rejected") { expect_throws_with(ConfigError, "lower bound", InputRange{0, 10, 2}.validate()); }

TEST_CASE("overflow while expanding is a ConfigError, not a wraparound") {
    constexpr auto MAX = std::numeric_limits<std::uint64_t>::max();
    expect_throws_with(ConfigError, "overflow", static_cast<void>(InputRange{3, MAX, 2}.sizes()));
}

TEST_CASE("error message names the offending range") {
    expect_throws_with(ConfigError, "range(1, 10, 1)", InputRange{1, 10, 1}.validate());
}

// ─────────────────────────────────────────────────────────────────────────────
// InputSequence
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("input sequence")

TEST_CASE("identity generator yields the sizes themselves") {
    InputSequence<std::uint64_t> seq({1024, 4096, 4}, rangebench::identity_generator());
    sizes_t states;
    for (auto [size, state] : seq) {
        expect(state).to_equal(size);
        states.push_back(state);
    }
    expect(states).to_equal(sizes_t{1024, 4096});
}

TEST_CASE("generator runs once per size however often the sequence is walked") {
    int calls = 0;
    InputSequence<std::string> seq({1, 8, 2}, [&calls](std::uint64_t n) {
        ++calls;
        return std::string(n, 'x');
    });
    for (int pass = 0; pass < 3; ++pass) {
        for (auto [size, state] : seq) {
            expect(state.size()).to_equal(static_cast<std::size_t>(size));
        }
    }
    expect(calls).to_equal(4);
}

TEST_CASE("states are generated lazily, in index order of access") {
    sizes_t seen;
    InputSequence<std::uint64_t> seq({2, 32, 2}, [&seen](std::uint64_t n) {
        seen.push_back(n);
        return n;
    });
    expect(seen.empty()).to_be_true();
    static_cast<void>(seq.state_at(2));
    static_cast<void>(seq.state_at(0));
    expect(seen).to_equal(sizes_t{8, 2});
    expect(seq.is_materialized(1)).to_be_false();
}

TEST_CASE("release() drops a state and the next access regenerates it") {
    int calls = 0;
    InputSequence<std::uint64_t> seq({1, 4, 2}, [&calls](std::uint64_t n) {
        ++calls;
        return n * 10;
    });
    expect(seq.state_at(1)).to_equal(std::uint64_t{20});
    seq.release(1);
    expect(seq.is_materialized(1)).to_be_false();
    expect(seq.state_at(1)).to_equal(std::uint64_t{20});
    expect(calls).to_equal(2);
    seq.release_all();
    expect(seq.is_materialized(1)).to_be_false();
}

TEST_CASE("an empty range produces an empty sequence without calling the generator") {
    int calls = 0;
    InputSequence<std::uint64_t> seq({100, 10, 2}, [&calls](std::uint64_t n) {
        ++calls;
        return n;
    });
    expect(seq.empty()).to_be_true();
    expect(seq.begin() == seq.end()).to_be_true();
    expect(calls).to_equal(0);
}

TEST_CASE("constructing over an invalid range throws before generating") {
    int calls = 0;
    expect_throws(ConfigError, InputSequence<std::uint64_t>({1, 10, 1}, [&calls](std::uint64_t n) {
                      ++calls;
                      return n;
                  }));
    expect(calls).to_equal(0);
}

TEST_CASE("a missing generator is a ConfigError") { expect_throws(ConfigError, InputSequence<int>({1, 10, 2}, rangebench::Generator<int>{})); }

TEST_CASE("size_at() out of range throws") {
    InputSequence<std::uint64_t> seq({1, 1, 2}, rangebench::identity_generator());
    expect_throws(std::out_of_range, static_cast<void>(seq.size_at(1)));
}

// ─────────────────────────────────────────────────────────────────────────────
// Generator composition
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("generator composition")

TEST_CASE("compose applies the second stage to the first stage's output") {
    auto as_vector = rangebench::compose<std::uint64_t, std::vector<int>>(rangebench::identity_generator(),
                                                                          [](std::uint64_t n) { return std::vector<int>(n, 1); });
    auto total = rangebench::compose<std::vector<int>, int>(as_vector, [](std::vector<int> v) {
        int sum = 0;
        for (int x : v) {
            sum += x;
        }
        return sum;
    });
    expect(total(5)).to_equal(5);
    expect(as_vector(3).size()).to_equal(std::size_t{3});
}
