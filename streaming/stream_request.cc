/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <fmt/ranges.h>

#include "streaming/stream_request.hh"

auto fmt::formatter<streaming::stream_request>::format(const streaming::stream_request& sr, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    auto out = fmt::format_to(ctx.out(), "{{keyspace={}, tables=", sr.keyspace);
    if (sr.column_families.empty()) {
        out = fmt::format_to(out, "all");
    } else {
        out = fmt::format_to(out, "{}", fmt::join(sr.column_families, ","));
    }
    if (sr.ranges.empty()) {
        return fmt::format_to(out, ", whole files}}");
    }
    return fmt::format_to(out, ", {} byte ranges}}", sr.ranges.size());
}
