/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/stream_session_state.hh"

auto fmt::formatter<streaming::stream_session_state>::format(streaming::stream_session_state s, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using enum streaming::stream_session_state;
    std::string_view name = "UNKNOWN";
    switch (s) {
    case INITIALIZED: name = "INITIALIZED"; break;
    case PREPARING: name = "PREPARING"; break;
    case STREAMING: name = "STREAMING"; break;
    case CLOSING: name = "CLOSING"; break;
    case COMPLETE: name = "COMPLETE"; break;
    case FAILED: name = "FAILED"; break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
}
