/*
 * Copyright (C) 2020-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "streaming/stream_reason.hh"

#include <array>
#include <stdexcept>
#include <utility>

namespace streaming {

static constexpr std::array<std::pair<stream_reason, std::string_view>, 8> stream_reason_names = {{
    {stream_reason::unspecified, "unspecified"},
    {stream_reason::bootstrap, "bootstrap"},
    {stream_reason::decommission, "decommission"},
    {stream_reason::removenode, "removenode"},
    {stream_reason::rebuild, "rebuild"},
    {stream_reason::repair, "repair"},
    {stream_reason::replace, "replace"},
    {stream_reason::rebalance, "rebalance"},
}};

std::string_view to_string(stream_reason reason) noexcept {
    for (auto& [r, name] : stream_reason_names) {
        if (r == reason) {
            return name;
        }
    }
    return "unknown";
}

stream_reason parse_stream_reason(std::string_view name) {
    for (auto& [r, n] : stream_reason_names) {
        if (n == name) {
            return r;
        }
    }
    throw std::invalid_argument(fmt::format("unknown stream reason '{}'", name));
}

}
