/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "streaming/messages/stream_message.hh"
#include "streaming/messages/file_message_header.hh"
#include "streaming/streaming_database_interface.hh"

namespace streaming::messages {

/**
 * Carries one file. Only the header goes through the envelope; the sender
 * writes the section bytes right after it and the receiver reads header.size
 * bytes before the next envelope.
 */
class file_message : public stream_message {
public:
    file_message_header header;
    // The file to read the sections from. Only set on the sending side.
    stream_file_ptr file;

    file_message() : stream_message(stream_message_type::FILE) {}
    explicit file_message(file_message_header h, stream_file_ptr f = {})
        : stream_message(stream_message_type::FILE)
        , header(std::move(h))
        , file(std::move(f)) {
    }
};

} // namespace streaming::messages

namespace ser {

template<>
struct serializer<streaming::messages::file_message_header> {
    template<typename Input>
    static streaming::messages::file_message_header read(Input& in) {
        streaming::messages::file_message_header h;
        h.cf_id = deserialize(in, boost::type<table_id>());
        h.sequence_number = deserialize(in, boost::type<uint32_t>());
        h.keyspace = deserialize(in, boost::type<sstring>());
        h.table = deserialize(in, boost::type<sstring>());
        h.file_name = deserialize(in, boost::type<sstring>());
        h.estimated_keys = deserialize(in, boost::type<uint64_t>());
        h.sections = deserialize(in, boost::type<streaming::byte_range_vector>());
        h.size = deserialize(in, boost::type<uint64_t>());
        for (auto& [start, end] : h.sections) {
            if (end < start) {
                throw streaming::protocol_exception(format("File {} has an inverted section [{}, {})", h.file_name, start, end));
            }
        }
        auto expected = streaming::messages::file_message_header::total_size(h.sections);
        if (h.size != expected) {
            throw streaming::protocol_exception(format("File {} announces {} bytes but its sections add up to {}", h.file_name, h.size, expected));
        }
        return h;
    }
    template<typename Output>
    static void write(Output& out, const streaming::messages::file_message_header& v) {
        serialize(out, v.cf_id);
        serialize(out, v.sequence_number);
        serialize(out, v.keyspace);
        serialize(out, v.table);
        serialize(out, v.file_name);
        serialize(out, v.estimated_keys);
        serialize(out, v.sections);
        serialize(out, v.size);
    }
};

template<>
struct serializer<streaming::messages::file_message> {
    template<typename Input>
    static streaming::messages::file_message read(Input& in) {
        return streaming::messages::file_message(deserialize(in, boost::type<streaming::messages::file_message_header>()));
    }
    template<typename Output>
    static void write(Output& out, const streaming::messages::file_message& v) {
        serialize(out, v.header);
    }
};

}
