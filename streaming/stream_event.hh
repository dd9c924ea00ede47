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
#include "streaming/session_info.hh"
#include "streaming/progress_info.hh"

namespace streaming {

// Events a plan reports to its stream_event_handlers, always on the shard
// of the plan.
struct stream_event {
    streaming::plan_id plan_id;
    gms::inet_address peer;

    stream_event(streaming::plan_id plan_id_, gms::inet_address peer_)
        : plan_id(plan_id_)
        , peer(peer_) {
    }
};

// Both sides exchanged their summaries.
struct session_prepared_event : public stream_event {
    session_info session;
    session_prepared_event(streaming::plan_id plan_id_, session_info session_)
        : stream_event(plan_id_, session_.peer)
        , session(std::move(session_)) {
    }
};

struct progress_event : public stream_event {
    progress_info progress;
    progress_event(streaming::plan_id plan_id_, progress_info progress_)
        : stream_event(plan_id_, progress_.peer)
        , progress(std::move(progress_)) {
    }
};

struct session_complete_event : public stream_event {
    bool success;
    session_complete_event(streaming::plan_id plan_id_, gms::inet_address peer_, bool success_)
        : stream_event(plan_id_, peer_)
        , success(success_) {
    }
};

} // namespace streaming
