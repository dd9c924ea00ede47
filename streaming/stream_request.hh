/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/sstring.hh>
#include <vector>

#include "seastarx.hh"
#include "serializer.hh"
#include "streaming/stream_fwd.hh"

namespace streaming {

// Asks the peer to send the files of the given tables. When ranges is
// empty, whole files are requested; otherwise only the given byte ranges of
// every file.
class stream_request {
public:
    sstring keyspace;
    byte_range_vector ranges;
    std::vector<sstring> column_families;
    stream_request() = default;
    stream_request(sstring _keyspace, byte_range_vector _ranges, std::vector<sstring> _column_families)
        : keyspace(std::move(_keyspace))
        , ranges(std::move(_ranges))
        , column_families(std::move(_column_families)) {
    }

    bool operator==(const stream_request&) const = default;
};

} // namespace streaming

namespace ser {

template<>
struct serializer<streaming::stream_request> {
    template<typename Input>
    static streaming::stream_request read(Input& in) {
        auto keyspace = deserialize(in, boost::type<sstring>());
        auto ranges = deserialize(in, boost::type<streaming::byte_range_vector>());
        auto cfs = deserialize(in, boost::type<std::vector<sstring>>());
        return streaming::stream_request(std::move(keyspace), std::move(ranges), std::move(cfs));
    }
    template<typename Output>
    static void write(Output& out, const streaming::stream_request& v) {
        serialize(out, v.keyspace);
        serialize(out, v.ranges);
        serialize(out, v.column_families);
    }
};

}

template <> struct fmt::formatter<streaming::stream_request> : fmt::formatter<string_view> {
    auto format(const streaming::stream_request&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
