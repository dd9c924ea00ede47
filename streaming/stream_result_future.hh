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
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/lowres_clock.hh>
#include "gms/inet_address.hh"
#include "streaming/stream_coordinator.hh"
#include "streaming/stream_event_handler.hh"
#include "streaming/stream_state.hh"
#include "streaming/progress_info.hh"
#include "streaming/messages/stream_init_message.hh"
#include <vector>

namespace streaming {

/**
 * The outcome of one plan on this node, shared by all of its sessions.
 *
 * The initiator creates it with the sessions of its stream_plan, the
 * receiver with the single session of an accepted connection. It stays in
 * the stream_manager's registry until every session closed, then resolves
 * with the final stream_state, or fails with stream_exception if any
 * session failed. Session events are relayed to the listeners.
 */
class stream_result_future : public enable_shared_from_this<stream_result_future> {
public:
    streaming::plan_id plan_id;
    sstring description;
private:
    stream_manager& _mgr;
    shared_ptr<stream_coordinator> _coordinator;
    std::vector<stream_event_handler*> _event_listeners;
    failure_policy _policy;
    shared_promise<stream_state> _done;
    lowres_clock::time_point _start_time;
public:
    stream_result_future(stream_manager& mgr, streaming::plan_id plan_id_, sstring description_, shared_ptr<stream_coordinator> coordinator_,
            failure_policy policy = failure_policy::best_effort)
        : plan_id(std::move(plan_id_))
        , description(std::move(description_))
        , _mgr(mgr)
        , _coordinator(coordinator_)
        , _policy(policy)
        , _start_time(lowres_clock::now()) {
    }

public:
    shared_ptr<stream_coordinator> get_coordinator() { return _coordinator; };

    failure_policy policy() const noexcept { return _policy; }

    // Resolves once every session of the plan is closed.
    future<stream_state> get_future() {
        return _done.get_shared_future();
    }

public:
    static future<stream_state> init_sending_side(stream_manager& mgr, streaming::plan_id plan_id_, sstring description_,
            std::vector<stream_event_handler*> listeners_, shared_ptr<stream_coordinator> coordinator_, failure_policy policy);

    // Sets up the plan of an accepted connection and returns its only
    // session. Throws if the plan is already known here.
    static shared_ptr<stream_session> init_receiving_side(stream_manager& mgr, const messages::stream_init_message& init);

public:
    void add_event_listener(stream_event_handler* listener) {
        _event_listeners.push_back(listener);
    }

    stream_state get_current_state() const;

    void handle_session_prepared(shared_ptr<stream_session> session);

    void handle_session_complete(shared_ptr<stream_session> session);

    void handle_progress(progress_info progress);

    template <typename Event>
    void fire_stream_event(Event event);

    stream_manager& manager() noexcept { return _mgr; }
    const stream_manager& manager() const noexcept { return _mgr; }

private:
    // Waits for every session and publishes the outcome of the plan.
    future<> run();
    void start();
    future<sstring> transfer_stats() const;
};

} // namespace streaming
