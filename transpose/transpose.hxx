#pragma once

/**
 * @file transpose.hxx
 * @brief Pivots `Name,Time (ns)` benchmark CSV into one column per benchmark family
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Input (the reporter's wire format):
 *
 *   Name,Time (ns)
 *   range_bench/pop/1024,102541
 *   range_bench/pop/4096,423289
 *   gen_bench/pop/1024,102316
 *   gen_bench/pop/4096,416523
 *
 * Output:
 *
 *   Size,range_bench/pop,gen_bench/pop
 *   1024,102541,102316
 *   4096,423289,416523
 *
 * Families keep first-seen order, sizes are sorted ascending, and a missing
 * (family, size) pair leaves an empty cell.
 */

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "../errors/errors.hxx"

namespace rangebench {

// ─────────────────────────────────────────────────────────────────────────────
// Row parsing
// ─────────────────────────────────────────────────────────────────────────────

struct ParsedRow {
    std::string family;  // qualified name minus the trailing "/<size>"
    std::uint64_t size{};
    std::uint64_t time_ns{};
};

namespace transpose_detail {

inline constexpr std::string_view HEADER = "Name,Time (ns)";

inline auto parse_u64(std::string_view digits, std::uint64_t& out) -> bool {
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return ec == std::errc{} && ptr == digits.data() + digits.size();
}

inline auto strip_cr(std::string_view line) -> std::string_view {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace transpose_detail

/**
 * Parses one line of reporter output.
 *
 * @return std::nullopt for blank lines and for the `Name,Time (ns)` header
 *         (which may repeat when several runs were concatenated).
 * @throws TransposeError for anything else that is not `entry/body/size,time`.
 */
inline auto parse_row(std::string_view line, std::size_t line_num) -> std::optional<ParsedRow> {
    line = transpose_detail::strip_cr(line);
    if (line.empty() || line == transpose_detail::HEADER) {
        return std::nullopt;
    }

    auto comma = line.find(',');
    if (comma == std::string_view::npos || line.find(',', comma + 1) != std::string_view::npos) {
        throw TransposeError(line_num, std::string(line), "expected exactly two comma-separated fields");
    }
    std::string_view name = line.substr(0, comma);
    std::string_view time = line.substr(comma + 1);

    auto slash = name.rfind('/');
    if (slash == std::string_view::npos) {
        throw TransposeError(line_num, std::string(line), "name has no '/<size>' suffix");
    }
    std::string_view family = name.substr(0, slash);
    std::string_view size = name.substr(slash + 1);

    // <entry>/<body>: a '/' with at least one character on each side. Bodies may
    // themselves contain '/' or end with one.
    if (family.size() < 3 || family.substr(1, family.size() - 2).find('/') == std::string_view::npos) {
        throw TransposeError(line_num, std::string(line), "name is not of the form entry/body/size");
    }

    ParsedRow row{.family = std::string(family)};
    if (!transpose_detail::parse_u64(size, row.size)) {
        throw TransposeError(line_num, std::string(line), "size '" + std::string(size) + "' is not an unsigned integer");
    }
    if (!transpose_detail::parse_u64(time, row.time_ns)) {
        throw TransposeError(line_num, std::string(line), "time '" + std::string(time) + "' is not an unsigned integer");
    }
    return row;
}

// ─────────────────────────────────────────────────────────────────────────────
// Transposer — accumulates rows, then writes the pivoted table
// ─────────────────────────────────────────────────────────────────────────────

class Transposer {
   public:
    /** Parses and records one input line. Blank and header lines are ignored. */
    void add_line(std::string_view line) {
        ++line_num_;
        if (auto row = parse_row(line, line_num_)) {
            add(*row, line);
        }
    }

    void add(const ParsedRow& row) { add(row, {}); }

    [[nodiscard]] auto families() const -> const std::vector<std::string>& { return families_; }

    [[nodiscard]] auto sizes() const -> std::vector<std::uint64_t> {
        std::vector<std::uint64_t> out;
        out.reserve(cells_.size());
        for (const auto& [size, row] : cells_) {
            out.push_back(size);
        }
        return out;
    }

    [[nodiscard]] auto cell(const std::string& family, std::uint64_t size) const -> std::optional<std::uint64_t> {
        auto fam = family_index_.find(family);
        auto row = cells_.find(size);
        if (fam == family_index_.end() || row == cells_.end()) {
            return std::nullopt;
        }
        auto col = row->second.find(fam->second);
        if (col == row->second.end()) {
            return std::nullopt;
        }
        return col->second;
    }

    void write(std::ostream& out) const {
        out << "Size";
        for (const auto& family : families_) {
            out << ',' << family;
        }
        out << '\n';

        for (const auto& [size, row] : cells_) {
            out << size;
            for (std::size_t col = 0; col < families_.size(); ++col) {
                out << ',';
                if (auto it = row.find(col); it != row.end()) {
                    out << it->second;
                }
            }
            out << '\n';
        }
    }

   private:
    void add(const ParsedRow& row, std::string_view line) {
        auto [fam_it, inserted] = family_index_.try_emplace(row.family, families_.size());
        if (inserted) {
            families_.push_back(row.family);
        }
        auto& cells = cells_[row.size];
        if (!cells.try_emplace(fam_it->second, row.time_ns).second) {
            throw TransposeError(line_num_, std::string(line.empty() ? row.family : line),
                                 "duplicate result for " + row.family + " at size " + std::to_string(row.size));
        }
    }

    std::size_t line_num_ = 0;
    std::vector<std::string> families_;
    std::unordered_map<std::string, std::size_t> family_index_;
    std::map<std::uint64_t, std::map<std::size_t, std::uint64_t>> cells_;  // size -> column -> ns
};

/**
 * Reads reporter CSV from `in` until EOF and writes the pivoted table to
 * `out`. When `echo` is set, every input line is copied to it as read.
 *
 * @throws TransposeError on the first malformed line; nothing is written to
 *         `out` in that case.
 */
inline void transpose(std::istream& in, std::ostream& out, std::ostream* echo = nullptr) {
    Transposer table;
    std::string line;
    while (std::getline(in, line)) {
        if (echo != nullptr) {
            *echo << line << '\n';
        }
        table.add_line(line);
    }
    table.write(out);
}

}  // namespace rangebench
