/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "gms/inet_address.hh"
#include <seastar/core/sstring.hh>
#include <fmt/core.h>

namespace streaming {

// How far one file of a session got, as seen by this node.
struct progress_info {
    using inet_address = gms::inet_address;
    enum class direction { OUT, IN };

    inet_address peer;
    // <keyspace>/<table>/<file>
    sstring file_name;
    direction dir = direction::OUT;
    uint64_t current_bytes = 0;
    uint64_t total_bytes = 0;

    progress_info() = default;
    progress_info(inet_address peer_, sstring file_name_, direction dir_, uint64_t current, uint64_t total)
        : peer(peer_)
        , file_name(std::move(file_name_))
        , dir(dir_)
        , current_bytes(current)
        , total_bytes(total) {
    }

    bool is_completed() const noexcept {
        return current_bytes >= total_bytes;
    }
};

} // namespace streaming

template <> struct fmt::formatter<streaming::progress_info> : fmt::formatter<string_view> {
    auto format(const streaming::progress_info&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
