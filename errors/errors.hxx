#pragma once

/**
 * @file errors.hxx
 * @brief Exception types reported by the benchmark engine
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace rangebench {

// Bad range, bad name, bad thresholds. Raised before any body of the
// offending entry runs.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A benchmark body threw. The failed run contributes nothing to the totals.
struct BenchmarkFailure : std::runtime_error {
    std::string qualified_name;

    BenchmarkFailure(std::string name, const std::string& reason)
        : std::runtime_error("benchmark '" + name + "' failed: " + reason), qualified_name(std::move(name)) {}
};

// Malformed line fed to the transpose tool.
struct TransposeError : std::runtime_error {
    std::size_t line{};
    std::string text;

    TransposeError(std::size_t line_num, std::string line_text, const std::string& reason)
        : std::runtime_error("line " + std::to_string(line_num) + ": " + reason + ": \"" + line_text + "\""),
          line(line_num),
          text(std::move(line_text)) {}
};

}  // namespace rangebench
