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
#include "streaming/stream_request.hh"
#include "streaming/stream_summary.hh"

namespace streaming::messages {

class prepare_message : public stream_message {
public:
    /**
     * Streaming requests
     */
    std::vector<stream_request> requests;

    /**
     * Summaries of streaming out
     */
    std::vector<stream_summary> summaries;

    prepare_message() : stream_message(stream_message_type::PREPARE) {}
    prepare_message(std::vector<stream_request> reqs, std::vector<stream_summary> sums)
        : stream_message(stream_message_type::PREPARE)
        , requests(std::move(reqs))
        , summaries(std::move(sums)) {
    }
};

} // namespace streaming::messages

namespace ser {

template<>
struct serializer<streaming::messages::prepare_message> {
    template<typename Input>
    static streaming::messages::prepare_message read(Input& in) {
        auto requests = deserialize(in, boost::type<std::vector<streaming::stream_request>>());
        auto summaries = deserialize(in, boost::type<std::vector<streaming::stream_summary>>());
        return streaming::messages::prepare_message(std::move(requests), std::move(summaries));
    }
    template<typename Output>
    static void write(Output& out, const streaming::messages::prepare_message& v) {
        serialize(out, v.requests);
        serialize(out, v.summaries);
    }
};

}
