/**
 * demo.cpp — a small benchmark executable built on bench_main.hpp
 *
 * Three entries measure draining a std::vector:
 *
 *   range_bench  bodies get the raw size and build the vector themselves,
 *                pausing the timer around the build.
 *   gen_bench    a generator builds the vector once per size; every run
 *                receives its own copy, made outside the timed interval.
 *   random_bench two bodies share one generated vector of random values.
 *
 * Try:
 *   ./rangebench_demo -d 0.1 -r 4
 *   ./rangebench_demo --filter gen_bench | ./rangebench_transpose
 */

#include <cstdint>
#include <random>
#include <vector>

#include "bench_main.hpp"

using rangebench::State;

namespace {

auto make_iota(std::uint64_t n) -> std::vector<std::uint64_t> {
    std::vector<std::uint64_t> vec;
    vec.reserve(n);
    for (std::uint64_t i = 0; i < n; ++i) {
        vec.push_back(i);
    }
    return vec;
}

auto make_random(std::uint64_t n) -> std::vector<std::uint64_t> {
    std::mt19937_64 rng{n};
    std::vector<std::uint64_t> vec(n);
    for (auto& v : vec) {
        v = rng();
    }
    return vec;
}

void bm_vector_range(State<std::uint64_t>& state) {
    const std::uint64_t n = state.input();
    state.pause();
    auto vec = make_iota(n);
    state.resume();
    while (!vec.empty()) {
        rangebench::DoNotOptimize(vec.back());
        vec.pop_back();
    }
    // freeing the empty vector is not part of the measurement
    state.pause();
}

void bm_vector_gen(State<std::vector<std::uint64_t>>& state) {
    auto& vec = state.input();
    while (!vec.empty()) {
        rangebench::DoNotOptimize(vec.back());
        vec.pop_back();
    }
}

void bm_vector_iterate(State<std::vector<std::uint64_t>>& state) {
    std::uint64_t sum = 0;
    for (auto v : state.input()) {
        sum += v;
    }
    rangebench::DoNotOptimize(sum);
}

void bm_vector_delete(State<std::vector<std::uint64_t>>& state) {
    auto vec = state.take_input();
    vec.clear();
    rangebench::ClobberMemory();
}

void register_benchmarks(rangebench::Registry& registry) {
    constexpr std::uint64_t LOWER = std::uint64_t{1} << 10;
    constexpr std::uint64_t UPPER = std::uint64_t{1} << 20;
    constexpr std::uint64_t MUL = 4;

    registry.add(rangebench::Benchmark<>::with_name("range_bench").with_range(LOWER, UPPER, MUL).with_bench(RB_BENCH(bm_vector_range)));

    registry.add(rangebench::Benchmark<>::with_name("gen_bench").with_range(LOWER, UPPER, MUL).with_generator(make_iota).with_bench(RB_BENCH(bm_vector_gen)));

    registry.add(rangebench::Benchmark<>::with_name("random_bench")
                     .with_range(LOWER, UPPER, MUL)
                     .with_generator(make_random)
                     .with_bench(RB_BENCH(bm_vector_iterate))
                     .with_bench(RB_BENCH(bm_vector_delete)));
}

}  // namespace

RB_BENCH_MAIN(register_benchmarks)
