/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "schema/schema_fwd.hh"
#include "serializer.hh"
#include <fmt/core.h>

namespace streaming {

/**
 * Summary of streaming.
 */
class stream_summary {
public:
    table_id cf_id;

    /**
     * Number of files to transfer. Can be 0 if nothing to transfer for some streaming request.
     */
    uint32_t files = 0;
    uint64_t total_size = 0;

    stream_summary() = default;
    stream_summary(table_id _cf_id, uint32_t _files, uint64_t _total_size)
        : cf_id (_cf_id)
        , files(_files)
        , total_size(_total_size) {
    }

    bool operator==(const stream_summary&) const = default;
};

} // namespace streaming

namespace ser {

template<>
struct serializer<streaming::stream_summary> {
    template<typename Input>
    static streaming::stream_summary read(Input& in) {
        auto cf_id = deserialize(in, boost::type<table_id>());
        auto files = deserialize(in, boost::type<uint32_t>());
        auto total_size = deserialize(in, boost::type<uint64_t>());
        return streaming::stream_summary(cf_id, files, total_size);
    }
    template<typename Output>
    static void write(Output& out, const streaming::stream_summary& v) {
        serialize(out, v.cf_id);
        serialize(out, v.files);
        serialize(out, v.total_size);
    }
};

}

template <> struct fmt::formatter<streaming::stream_summary> : fmt::formatter<string_view> {
    auto format(const streaming::stream_summary&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
