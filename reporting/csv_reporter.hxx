#pragma once

/**
 * @file csv_reporter.hxx
 * @brief Result sinks: the streaming `Name,Time (ns)` CSV writer and an in-memory collector
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace rangebench {

// ─────────────────────────────────────────────────────────────────────────────
// RunResult — one (entry, body, size) triple after its stopping criterion held
// ─────────────────────────────────────────────────────────────────────────────

struct RunResult {
    std::string qualified_name;
    std::uint64_t mean_ns{};
    std::uint64_t run_count{};
    std::uint64_t total_ns{};

    auto operator==(const RunResult&) const -> bool = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Reporter — where the runner sends results, in production order
// ─────────────────────────────────────────────────────────────────────────────

class Reporter {
   public:
    Reporter() = default;
    Reporter(const Reporter&) = delete;
    auto operator=(const Reporter&) -> Reporter& = delete;
    virtual ~Reporter() = default;

    virtual void report(const RunResult& result) = 0;

    /** Called once after the last result (also when there were none). */
    virtual void finish() {}
};

// ─────────────────────────────────────────────────────────────────────────────
// CsvReporter
//
//   Name,Time (ns)
//   range_bench/pop/1024,103674
//   range_bench/pop/4096,412499
//
// Each row is flushed immediately so results survive a later body failure.
// The header is written once, before the first row, or by finish() when no
// row was produced.
// ─────────────────────────────────────────────────────────────────────────────

class CsvReporter final : public Reporter {
   public:
    static constexpr const char* HEADER = "Name,Time (ns)";

    explicit CsvReporter(std::ostream& out) : out_(out) {}

    void report(const RunResult& result) override {
        write_header_once();
        out_ << result.qualified_name << ',' << result.mean_ns << '\n';
        out_.flush();
        ++rows_;
    }

    void finish() override {
        write_header_once();
        out_.flush();
    }

    [[nodiscard]] auto rows() const -> std::size_t { return rows_; }

   private:
    void write_header_once() {
        if (header_written_) {
            return;
        }
        out_ << HEADER << '\n';
        header_written_ = true;
    }

    std::ostream& out_;
    bool header_written_ = false;
    std::size_t rows_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// CollectingReporter — keeps results in memory (tests, programmatic use)
// ─────────────────────────────────────────────────────────────────────────────

class CollectingReporter final : public Reporter {
   public:
    void report(const RunResult& result) override { results_.push_back(result); }
    void finish() override { finished_ = true; }

    [[nodiscard]] auto results() const -> const std::vector<RunResult>& { return results_; }
    [[nodiscard]] auto finished() const -> bool { return finished_; }

   private:
    std::vector<RunResult> results_;
    bool finished_ = false;
};

}  // namespace rangebench
