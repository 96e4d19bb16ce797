#pragma once

/**
 * @file benchmark.hxx
 * @brief Benchmark entries (name + input range + bodies), their builder, and the ordered registry
 * @version 2.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "../errors/errors.hxx"
#include "../input/input_range.hxx"
#include "../logger/logger.hxx"
#include "../reporting/csv_reporter.hxx"
#include "config.hxx"
#include "runner.hxx"
#include "state.hxx"

namespace rangebench {

namespace bench_detail {

// Names become `/`-separated path segments inside a comma-separated row.
inline void check_name(std::string_view what, std::string_view name) {
    if (name.empty()) {
        throw ConfigError(std::string(what) + " name must not be empty");
    }
    if (name.find_first_of(",/\n\r") != std::string_view::npos) {
        throw ConfigError(std::string(what) + " name '" + std::string(name) + "' must not contain ',', '/' or line breaks");
    }
}

}  // namespace bench_detail

// ─────────────────────────────────────────────────────────────────────────────
// BenchmarkEntry — type-erased view the registry iterates over
// ─────────────────────────────────────────────────────────────────────────────

class BenchmarkEntry {
   public:
    virtual ~BenchmarkEntry() = default;

    [[nodiscard]] virtual auto name() const -> const std::string& = 0;
    [[nodiscard]] virtual auto body_names() const -> std::vector<std::string> = 0;
    [[nodiscard]] virtual auto range() const -> const InputRange& = 0;

    /** Throws ConfigError if the entry cannot run. Executes nothing. */
    virtual void validate() const = 0;

    /** Runs every body over the whole range, reporting rows in order. */
    virtual void run(const RunConfig& config, Reporter& reporter) const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Benchmark<T>
//
//   auto make_vec(std::uint64_t n) -> std::vector<std::uint64_t> { ... }
//   void bm_pop(rangebench::State<std::vector<std::uint64_t>>& state) { ... }
//
//   registry.add(rangebench::Benchmark<>::with_name("gen_bench")
//                    .with_range(1 << 10, 1 << 20, 4)
//                    .with_generator(make_vec)
//                    .with_bench(RB_BENCH(bm_pop)));
//
// T is the input type the bodies receive: the raw size (std::uint64_t) until
// a generator is set, the generator's result type afterwards.
// ─────────────────────────────────────────────────────────────────────────────

template <typename T = std::uint64_t>
class Benchmark final : public BenchmarkEntry {
   public:
    using input_type = T;
    using body_fn = std::function<void(State<T>&)>;

    /** Starts a benchmark over raw sizes with the default range (1, 2^20, 2). */
    static auto with_name(std::string name) -> Benchmark<std::uint64_t>
        requires std::is_same_v<T, std::uint64_t>
    {
        bench_detail::check_name("benchmark", name);
        return Benchmark<std::uint64_t>(std::move(name), InputRange{}, identity_generator());
    }

    auto with_lower_bound(std::uint64_t lower) -> Benchmark& {
        range_.lower = lower;
        return *this;
    }

    auto with_upper_bound(std::uint64_t upper) -> Benchmark& {
        range_.upper = upper;
        return *this;
    }

    auto with_mul(std::uint64_t multiplier) -> Benchmark& {
        range_.multiplier = multiplier;
        return *this;
    }

    auto with_range(std::uint64_t lower, std::uint64_t upper, std::uint64_t multiplier) -> Benchmark& {
        range_ = InputRange{.lower = lower, .upper = upper, .multiplier = multiplier};
        return *this;
    }

    /**
     * Feeds the current input through `gen`, giving bodies a `U` instead of a
     * `T`. Successive generators compose. Must come before any with_bench().
     */
    template <typename Gen, typename U = std::decay_t<std::invoke_result_t<Gen&, T>>>
    auto with_generator(Gen gen) const -> Benchmark<U> {
        static_assert(std::is_copy_constructible_v<U>, "generated inputs are copied for every run and must be copy-constructible");
        if (!bodies_.empty()) {
            throw ConfigError(name_ + ": with_generator() must be called before with_bench()");
        }
        return Benchmark<U>(name_, range_, compose<T, U>(generator_, std::function<U(T)>(std::move(gen))));
    }

    auto with_bench(std::string body_name, body_fn fn) -> Benchmark& {
        bench_detail::check_name("body", body_name);
        if (!fn) {
            throw ConfigError(name_ + "/" + body_name + ": empty callable");
        }
        bodies_.push_back(Body<T>{.name = std::move(body_name), .fn = std::move(fn)});
        return *this;
    }

    auto with_bench(std::pair<std::string, body_fn> named) -> Benchmark& { return with_bench(std::move(named.first), std::move(named.second)); }

    // ── BenchmarkEntry ────────────────────────────────────────────────────

    [[nodiscard]] auto name() const -> const std::string& override { return name_; }

    [[nodiscard]] auto body_names() const -> std::vector<std::string> override {
        std::vector<std::string> out;
        out.reserve(bodies_.size());
        for (const auto& body : bodies_) {
            out.push_back(body.name);
        }
        return out;
    }

    [[nodiscard]] auto range() const -> const InputRange& override { return range_; }

    void validate() const override {
        if (bodies_.empty()) {
            throw ConfigError(name_ + ": no bodies registered");
        }
        try {
            range_.validate();
        } catch (const ConfigError& e) {
            throw ConfigError(name_ + ": " + e.what());
        }
    }

    void run(const RunConfig& config, Reporter& reporter) const override {
        validate();
        std::unique_ptr<InputSequence<T>> inputs;
        try {
            inputs = std::make_unique<InputSequence<T>>(range_, generator_);
        } catch (const ConfigError& e) {
            throw ConfigError(name_ + ": " + e.what());
        }
        run_bodies<T>(name_, bodies_, *inputs, config, reporter);
    }

   private:
    template <typename>
    friend class Benchmark;

    Benchmark(std::string name, InputRange range, Generator<T> generator)
        : name_(std::move(name)), range_(range), generator_(std::move(generator)) {}

    std::string name_;
    InputRange range_;
    Generator<T> generator_;
    std::vector<Body<T>> bodies_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Registry — entries in registration order
// ─────────────────────────────────────────────────────────────────────────────

class Registry {
   public:
    template <typename T>
    auto add(Benchmark<T> bench) -> Registry& {
        entries_.push_back(std::make_unique<Benchmark<T>>(std::move(bench)));
        return *this;
    }

    auto add(std::unique_ptr<BenchmarkEntry> entry) -> Registry& {
        if (!entry) {
            throw ConfigError("cannot register a null benchmark entry");
        }
        entries_.push_back(std::move(entry));
        return *this;
    }

    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }
    [[nodiscard]] auto entries() const -> const std::vector<std::unique_ptr<BenchmarkEntry>>& { return entries_; }

    /**
     * Checks every entry up front so a bad range or name aborts the process
     * before the first measurement.
     */
    void validate() const {
        for (const auto& entry : entries_) {
            entry->validate();
            try {
                // expands the range; overflow surfaces here
                static_cast<void>(entry->range().sizes());
            } catch (const ConfigError& e) {
                throw ConfigError(entry->name() + ": " + e.what());
            }
        }
    }

    /**
     * Runs entries in registration order, streaming rows into `reporter`.
     * Fails fast: the first ConfigError or BenchmarkFailure stops the run.
     * reporter.finish() is only called after a complete run.
     */
    void run_all(const RunConfig& config, Reporter& reporter) const {
        config.validate();
        validate();
        for (const auto& entry : entries_) {
            RB_LOG_INFO << "entry " << entry->name() << " " << entry->range().to_string();
            entry->run(config, reporter);
        }
        reporter.finish();
    }

   private:
    std::vector<std::unique_ptr<BenchmarkEntry>> entries_;
};

}  // namespace rangebench

// ─────────────────────────────────────────────────────────────────────────────
// RB_BENCH — pairs a function with its own name
//
//   bench.with_bench(RB_BENCH(bm_vector_pop));   // body name "bm_vector_pop"
// ─────────────────────────────────────────────────────────────────────────────

#define RB_BENCH(fn) std::make_pair(std::string(#fn), (fn))
