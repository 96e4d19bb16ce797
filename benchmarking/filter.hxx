#pragma once

/**
 * @file filter.hxx
 * @brief Substring filter over qualified benchmark names
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangebench {

/** `entry/body/size`, the key of one reported result. */
inline auto qualified_name(std::string_view entry, std::string_view body, std::uint64_t size) -> std::string {
    std::string out;
    out.reserve(entry.size() + body.size() + 22);
    out.append(entry).append("/").append(body).append("/").append(std::to_string(size));
    return out;
}

/**
 * True when no filter is set, or when `name` contains `filter` as a
 * contiguous, case-sensitive substring. An empty filter matches everything.
 */
inline auto matches(std::string_view name, const std::optional<std::string>& filter) -> bool {
    if (!filter) {
        return true;
    }
    return name.find(*filter) != std::string_view::npos;
}

}  // namespace rangebench
