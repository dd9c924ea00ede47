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
#include "streaming/stream_fwd.hh"
#include "streaming/stream_coordinator.hh"
#include "streaming/stream_reason.hh"
#include "streaming/stream_state.hh"
#include <vector>

namespace streaming {

/**
 * Builds the streaming work of one operation and runs it.
 *
 * Every call adds work for one peer; all work for the same peer goes
 * through a single session. Nothing touches the network before execute().
 *
 *     stream_plan plan(mgr, "Bootstrap", stream_reason::bootstrap);
 *     plan.request_ranges(peer, "ks", {}, {"cf"});
 *     auto state = co_await plan.execute();
 */
class stream_plan {
private:
    using inet_address = gms::inet_address;
    stream_manager& _mgr;
    plan_id _plan_id;
    sstring _description;
    stream_reason _reason;
    failure_policy _policy;
    std::vector<stream_event_handler*> _handlers;
    shared_ptr<stream_coordinator> _coordinator;
    bool _range_added = false;
    bool _aborted = false;
public:
    stream_plan(stream_manager& mgr, sstring description, stream_reason reason = stream_reason::unspecified,
                failure_policy policy = failure_policy::best_effort)
        : _mgr(mgr)
        , _plan_id(plan_id::create_random_id())
        , _description(std::move(description))
        , _reason(reason)
        , _policy(policy)
        , _coordinator(make_shared<stream_coordinator>())
    {
    }

    streaming::plan_id id() const noexcept {
        return _plan_id;
    }

    // Fetches the files of the given tables of keyspace from the peer, all
    // of its tables when column_families is empty. Empty ranges fetch whole
    // files.
    stream_plan& request_ranges(inet_address from, sstring keyspace, byte_range_vector ranges, std::vector<sstring> column_families = {});

    // Sends the files of the given tables of keyspace to the peer. Tables
    // are resolved when the plan executes.
    stream_plan& transfer_ranges(inet_address to, sstring keyspace, byte_range_vector ranges, std::vector<sstring> column_families = {});

    // The handlers must outlive the plan's execution.
    stream_plan& listeners(std::vector<stream_event_handler*> handlers);

    bool is_empty() const noexcept {
        return !_range_added;
    }

    /**
     * Connects to every peer and streams.
     *
     * Resolves with the final state once all sessions closed, or fails with
     * stream_exception carrying that state if any session failed. A plan
     * with no work resolves right away.
     */
    future<stream_state> execute();

    // Fails every open session of the plan; the peers are told.
    void abort() noexcept;

private:
    shared_ptr<stream_session> session_for(inet_address peer);
};

} // namespace streaming
