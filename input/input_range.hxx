#pragma once

/**
 * @file input_range.hxx
 * @brief Geometric input-size ranges and the lazily generated benchmark inputs built on them
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../errors/errors.hxx"

namespace rangebench {

// ─────────────────────────────────────────────────────────────────────────────
// InputRange — (lower, upper, multiplier) triple
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Describes the sizes lower, lower*m, lower*m^2, ... that do not exceed upper.
 *
 *   InputRange{1024, 4096, 4}.sizes()  ->  {1024, 4096}
 *   InputRange{10, 10, 2}.sizes()      ->  {10}
 *   InputRange{8, 4, 2}.sizes()        ->  {}
 */
struct InputRange {
    static constexpr std::uint64_t DEFAULT_LOWER = 1;
    static constexpr std::uint64_t DEFAULT_UPPER = std::uint64_t{1} << 20;
    static constexpr std::uint64_t DEFAULT_MULTIPLIER = 2;

    std::uint64_t lower = DEFAULT_LOWER;
    std::uint64_t upper = DEFAULT_UPPER;
    std::uint64_t multiplier = DEFAULT_MULTIPLIER;

    [[nodiscard]] auto to_string() const -> std::string {
        return "range(" + std::to_string(lower) + ", " + std::to_string(upper) + ", " + std::to_string(multiplier) + ")";
    }

    /** Throws ConfigError when the range can never terminate. */
    void validate() const {
        if (multiplier <= 1) {
            throw ConfigError(to_string() + ": multiplier must be greater than 1");
        }
        if (lower == 0) {
            throw ConfigError(to_string() + ": lower bound must be positive");
        }
    }

    /**
     * Expands the range into its strictly increasing size list.
     *
     * Stops after the last value <= upper. Computing a successor that does not
     * fit in 64 bits is reported as a ConfigError instead of wrapping.
     */
    [[nodiscard]] auto sizes() const -> std::vector<std::uint64_t> {
        validate();

        std::vector<std::uint64_t> out;
        if (lower > upper) {
            return out;
        }

        std::uint64_t value = lower;
        out.push_back(value);
        while (value < upper) {
            if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
                throw ConfigError(to_string() + ": overflow while multiplying " + std::to_string(value) + " by " + std::to_string(multiplier));
            }
            value *= multiplier;
            if (value > upper) {
                break;
            }
            out.push_back(value);
        }
        return out;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Generators
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
using Generator = std::function<T(std::uint64_t)>;

/** Default generator: the raw size is the input. */
inline auto identity_generator() -> Generator<std::uint64_t> {
    return [](std::uint64_t size) { return size; };
}

/** Chains `next` after `first`: size -> T -> U. */
template <typename T, typename U>
auto compose(Generator<T> first, std::function<U(T)> next) -> Generator<U> {
    return [first = std::move(first), next = std::move(next)](std::uint64_t size) -> U { return next(first(size)); };
}

// ─────────────────────────────────────────────────────────────────────────────
// InputSequence<T> — lazy, restartable (size, state) pairs
// ─────────────────────────────────────────────────────────────────────────────

/**
 * The expanded range of one benchmark entry together with its generator.
 *
 * Sizes are expanded eagerly on construction so range errors surface before
 * any body runs. States are produced on first access and memoised, so the
 * generator runs once per size however many times the sequence is walked.
 * release() drops a memoised state once no further body needs it; touching
 * that size again regenerates it.
 *
 * The memoised states are templates: the runner copies them for every run,
 * which requires T to be copy-constructible into an independent value.
 */
template <typename T>
class InputSequence {
   public:
    struct element {
        std::uint64_t size;
        const T& state;
    };

    class iterator {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = element;
        using difference_type = std::ptrdiff_t;

        iterator(InputSequence* seq, std::size_t index) : seq_(seq), index_(index) {}

        auto operator*() const -> element { return {seq_->size_at(index_), seq_->state_at(index_)}; }
        auto operator++() -> iterator& {
            ++index_;
            return *this;
        }
        auto operator==(const iterator& other) const -> bool { return seq_ == other.seq_ && index_ == other.index_; }
        auto operator!=(const iterator& other) const -> bool { return !(*this == other); }

       private:
        InputSequence* seq_;
        std::size_t index_;
    };

    InputSequence(const InputRange& range, Generator<T> generator)
        : range_(range), sizes_(range.sizes()), generator_(std::move(generator)), cache_(sizes_.size()) {
        if (!generator_) {
            throw ConfigError(range_.to_string() + ": missing generator");
        }
    }

    [[nodiscard]] auto range() const -> const InputRange& { return range_; }
    [[nodiscard]] auto sizes() const -> const std::vector<std::uint64_t>& { return sizes_; }
    [[nodiscard]] auto count() const -> std::size_t { return sizes_.size(); }
    [[nodiscard]] auto empty() const -> bool { return sizes_.empty(); }
    [[nodiscard]] auto size_at(std::size_t index) const -> std::uint64_t { return sizes_.at(index); }

    /** Generates the state for sizes()[index] on first use. */
    auto state_at(std::size_t index) -> const T& {
        auto& slot = cache_.at(index);
        if (!slot) {
            slot.emplace(generator_(sizes_[index]));
        }
        return *slot;
    }

    [[nodiscard]] auto is_materialized(std::size_t index) const -> bool { return cache_.at(index).has_value(); }

    void release(std::size_t index) { cache_.at(index).reset(); }

    void release_all() {
        for (auto& slot : cache_) {
            slot.reset();
        }
    }

    auto begin() -> iterator { return {this, 0}; }
    auto end() -> iterator { return {this, sizes_.size()}; }

   private:
    InputRange range_;
    std::vector<std::uint64_t> sizes_;
    Generator<T> generator_;
    std::vector<std::optional<T>> cache_;
};

}  // namespace rangebench
