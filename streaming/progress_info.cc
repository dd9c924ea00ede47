/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/progress_info.hh"

auto fmt::formatter<streaming::progress_info>::format(const streaming::progress_info& x, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    bool out = x.dir == streaming::progress_info::direction::OUT;
    // An empty file is done as soon as it starts
    double percent = x.total_bytes ? x.current_bytes * 100.0 / x.total_bytes : 100.0;
    return fmt::format_to(ctx.out(), "{} {}/{} bytes ({:.1f}%) {} {}", x.file_name, x.current_bytes, x.total_bytes, percent,
            out ? "to" : "from", x.peer);
}
