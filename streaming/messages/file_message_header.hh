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
#include <fmt/core.h>

#include "schema/schema_fwd.hh"
#include "serializer.hh"
#include "streaming/stream_fwd.hh"

namespace streaming::messages {

/**
 * Describes one file sent in a File message. The raw bytes of the sections
 * follow the header on the wire, in order, size bytes in total.
 */
struct file_message_header {
    table_id cf_id;
    uint32_t sequence_number = 0;
    sstring keyspace;
    sstring table;
    sstring file_name;
    uint64_t estimated_keys = 0;
    byte_range_vector sections;
    uint64_t size = 0;

    file_message_header() = default;
    file_message_header(table_id cf_id_, uint32_t seq, sstring ks, sstring cf, sstring name, uint64_t keys, byte_range_vector sections_)
        : cf_id(cf_id_)
        , sequence_number(seq)
        , keyspace(std::move(ks))
        , table(std::move(cf))
        , file_name(std::move(name))
        , estimated_keys(keys)
        , sections(std::move(sections_))
        , size(total_size(sections)) {
    }

    static uint64_t total_size(const byte_range_vector& sections) noexcept {
        uint64_t size = 0;
        for (auto& [start, end] : sections) {
            size += end - start;
        }
        return size;
    }

    bool operator==(const file_message_header&) const = default;
};

} // namespace streaming::messages

template <> struct fmt::formatter<streaming::messages::file_message_header> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const streaming::messages::file_message_header& h, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "[ {}.{} file={} seq={} sections={} size={} ]",
                h.keyspace, h.table, h.file_name, h.sequence_number, h.sections.size(), h.size);
    }
};
