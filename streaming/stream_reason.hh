/*
 * Copyright (C) 2018-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <fmt/format.h>

namespace streaming {

// Why a plan streams. Sent to the peer in the stream init message, so the
// values must not be renumbered.
enum class stream_reason : uint8_t {
    unspecified,
    bootstrap,
    decommission,
    removenode,
    rebuild,
    repair,
    replace,
    rebalance,
};

std::string_view to_string(stream_reason reason) noexcept;

// Throws std::invalid_argument for an unknown name.
stream_reason parse_stream_reason(std::string_view name);

}

template <>
struct fmt::formatter<streaming::stream_reason> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(streaming::stream_reason r, FormatContext& ctx) const {
        return formatter<string_view>::format(streaming::to_string(r), ctx);
    }
};
