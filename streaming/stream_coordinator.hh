/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "gms/inet_address.hh"
#include "streaming/stream_fwd.hh"
#include "streaming/stream_session.hh"
#include "streaming/session_info.hh"
#include <map>
#include <set>

namespace streaming {

/**
 * The sessions of one plan, one per peer.
 *
 * The stream_plan fills it while the plan is built; from execution on it is
 * shared with the plan's stream_result_future. A receiving plan has a single
 * session, the one of the accepted connection.
 */
class stream_coordinator {
public:
    using inet_address = gms::inet_address;

private:
    std::map<inet_address, shared_ptr<stream_session>> _peer_sessions;

public:
    shared_ptr<stream_session> get_or_create_session(stream_manager& mgr, inet_address peer);

    std::vector<shared_ptr<stream_session>> get_all_stream_sessions() const;

    std::set<inet_address> get_peers() const;

    // Snapshots of every session, in peer order.
    std::vector<session_info> get_all_session_info() const;

    // Binds every session to the result of the plan.
    void init_all_stream_sessions(shared_ptr<stream_result_future> result);

    // Initiator side: every session connects to its peer in the background.
    void connect_all_stream_sessions();

    void abort_all_stream_sessions();
};

} // namespace streaming
