/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "streaming/session_info.hh"
#include "streaming/stream_fwd.hh"
#include <algorithm>
#include <vector>

namespace streaming {

// Outcome of a plan: one session_info per peer.
class stream_state {
public:
    streaming::plan_id plan_id;
    sstring description;
    std::vector<session_info> sessions;

    stream_state(streaming::plan_id plan_id_, sstring description_, std::vector<session_info> sessions_)
        : plan_id(std::move(plan_id_))
        , description(std::move(description_))
        , sessions(std::move(sessions_)) {
    }

    bool has_failed_session() const {
        return std::ranges::any_of(sessions, [] (const session_info& s) { return s.is_failed(); });
    }

    std::vector<gms::inet_address> failed_peers() const {
        std::vector<gms::inet_address> peers;
        for (auto& s : sessions) {
            if (s.is_failed()) {
                peers.push_back(s.peer);
            }
        }
        return peers;
    }
};

} // namespace streaming
