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
#include "streaming/messages/stream_message.hh"

namespace streaming::messages {

// Asks the sender to send the file (cf_id, sequence_number) again.
class retry_message : public stream_message {
public:
    table_id cf_id;
    uint32_t sequence_number = 0;

    retry_message() : stream_message(stream_message_type::RETRY) {}
    retry_message(table_id cf_id_, uint32_t seq)
        : stream_message(stream_message_type::RETRY)
        , cf_id(cf_id_)
        , sequence_number(seq) {
    }
};

} // namespace streaming::messages

namespace ser {

template<>
struct serializer<streaming::messages::retry_message> {
    template<typename Input>
    static streaming::messages::retry_message read(Input& in) {
        auto cf_id = deserialize(in, boost::type<table_id>());
        auto seq = deserialize(in, boost::type<uint32_t>());
        return streaming::messages::retry_message(cf_id, seq);
    }
    template<typename Output>
    static void write(Output& out, const streaming::messages::retry_message& v) {
        serialize(out, v.cf_id);
        serialize(out, v.sequence_number);
    }
};

}
