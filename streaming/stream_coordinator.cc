/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/stream_coordinator.hh"
#include "log.hh"

namespace streaming {

extern logging::logger sslog;

shared_ptr<stream_session> stream_coordinator::get_or_create_session(stream_manager& mgr, inet_address peer) {
    auto& session = _peer_sessions[peer];
    if (!session) {
        session = make_shared<stream_session>(mgr, peer);
    }
    return session;
}

std::vector<shared_ptr<stream_session>> stream_coordinator::get_all_stream_sessions() const {
    std::vector<shared_ptr<stream_session>> results;
    results.reserve(_peer_sessions.size());
    for (auto& [peer, session] : _peer_sessions) {
        results.push_back(session);
    }
    return results;
}

std::set<gms::inet_address> stream_coordinator::get_peers() const {
    std::set<inet_address> results;
    for (auto& [peer, session] : _peer_sessions) {
        results.insert(peer);
    }
    return results;
}

std::vector<session_info> stream_coordinator::get_all_session_info() const {
    std::vector<session_info> results;
    results.reserve(_peer_sessions.size());
    for (auto& [peer, session] : _peer_sessions) {
        results.push_back(session->make_session_info());
    }
    return results;
}

void stream_coordinator::init_all_stream_sessions(shared_ptr<stream_result_future> result) {
    for (auto& [peer, session] : _peer_sessions) {
        session->init(result);
    }
}

void stream_coordinator::connect_all_stream_sessions() {
    // start() may fail the session on the spot, which must not touch the map
    for (auto& session : get_all_stream_sessions()) {
        sslog.debug("[Stream #{}] Beginning stream session with {}", session->plan_id(), session->peer);
        session->start();
    }
}

void stream_coordinator::abort_all_stream_sessions() {
    for (auto& session : get_all_stream_sessions()) {
        session->abort();
    }
}

} // namespace streaming
