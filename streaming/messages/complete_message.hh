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

namespace streaming::messages {

// Sent once every file the peer announced has been received.
class complete_message : public stream_message {
public:
    complete_message() : stream_message(stream_message_type::COMPLETE) {}
};

// Tells the peer this side gave up on the session.
class session_failed_message : public stream_message {
public:
    session_failed_message() : stream_message(stream_message_type::SESSION_FAILED) {}
};

} // namespace streaming::messages

namespace ser {

template<>
struct serializer<streaming::messages::complete_message> {
    template<typename Input>
    static streaming::messages::complete_message read(Input& in) {
        return {};
    }
    template<typename Output>
    static void write(Output& out, const streaming::messages::complete_message& v) {
    }
};

template<>
struct serializer<streaming::messages::session_failed_message> {
    template<typename Input>
    static streaming::messages::session_failed_message read(Input& in) {
        return {};
    }
    template<typename Output>
    static void write(Output& out, const streaming::messages::session_failed_message& v) {
    }
};

}
