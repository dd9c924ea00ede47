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

#include "gms/inet_address.hh"
#include "gms/inet_address_serializer.hh"
#include "serializer.hh"
#include "streaming/messages/stream_message.hh"
#include "streaming/stream_fwd.hh"
#include "streaming/stream_reason.hh"

namespace streaming::messages {

/**
 * First thing sent on a new connection, after the version byte. Tells the
 * acceptor which plan the connection belongs to.
 */
struct stream_init_message {
    gms::inet_address from;
    streaming::plan_id plan_id;
    sstring description;
    stream_reason reason = stream_reason::unspecified;

    bool operator==(const stream_init_message&) const = default;
};

} // namespace streaming::messages

namespace ser {

template<>
struct serializer<streaming::stream_reason> {
    template<typename Input>
    static streaming::stream_reason read(Input& in) {
        return streaming::stream_reason(deserialize(in, boost::type<uint8_t>()));
    }
    template<typename Output>
    static void write(Output& out, streaming::stream_reason v) {
        serialize(out, uint8_t(v));
    }
};

template<>
struct serializer<streaming::messages::stream_init_message> {
    template<typename Input>
    static streaming::messages::stream_init_message read(Input& in) {
        streaming::messages::stream_init_message m;
        m.from = deserialize(in, boost::type<gms::inet_address>());
        m.plan_id = deserialize(in, boost::type<streaming::plan_id>());
        m.description = deserialize(in, boost::type<sstring>());
        m.reason = deserialize(in, boost::type<streaming::stream_reason>());
        return m;
    }
    template<typename Output>
    static void write(Output& out, const streaming::messages::stream_init_message& v) {
        serialize(out, v.from);
        serialize(out, v.plan_id);
        serialize(out, v.description);
        serialize(out, v.reason);
    }
};

}

namespace streaming::messages {

/// Writes the connection preamble: the version byte followed by the
/// length-prefixed init message.
future<> write_handshake(output_stream<char>& out, const stream_init_message& init, protocol_version version = current_version);

/// Reads the version byte. Disengaged if the peer closed the connection
/// before sending anything.
future<std::optional<protocol_version>> read_version(input_stream<char>& in);

/// Reads the length-prefixed init message following the version byte.
future<stream_init_message> read_init_message(input_stream<char>& in, protocol_version version);

}
