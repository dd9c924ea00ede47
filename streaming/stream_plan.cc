/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/stream_plan.hh"
#include "streaming/stream_result_future.hh"
#include "streaming/stream_state.hh"
#include "log.hh"
#include <fmt/ranges.h>

namespace streaming {

extern logging::logger sslog;

shared_ptr<stream_session> stream_plan::session_for(inet_address peer) {
    _range_added = true;
    auto session = _coordinator->get_or_create_session(_mgr, peer);
    session->set_reason(_reason);
    return session;
}

stream_plan& stream_plan::request_ranges(inet_address from, sstring keyspace, byte_range_vector ranges, std::vector<sstring> column_families) {
    session_for(from)->add_stream_request(std::move(keyspace), std::move(ranges), std::move(column_families));
    return *this;
}

stream_plan& stream_plan::transfer_ranges(inet_address to, sstring keyspace, byte_range_vector ranges, std::vector<sstring> column_families) {
    session_for(to)->add_transfer_ranges(std::move(keyspace), std::move(ranges), std::move(column_families));
    return *this;
}

stream_plan& stream_plan::listeners(std::vector<stream_event_handler*> handlers) {
    _handlers.insert(_handlers.end(), handlers.begin(), handlers.end());
    return *this;
}

future<stream_state> stream_plan::execute() {
    sslog.debug("[Stream #{}] Executing stream_plan description={} reason={} peers={}", _plan_id, _description, _reason, _coordinator->get_peers());
    if (_aborted) {
        return make_exception_future<stream_state>(std::runtime_error(format("stream_plan {} is aborted", _plan_id)));
    }
    if (is_empty()) {
        return make_ready_future<stream_state>(stream_state(_plan_id, _description, {}));
    }
    return futurize_invoke([this] {
        return stream_result_future::init_sending_side(_mgr, _plan_id, _description, _handlers, _coordinator, _policy);
    });
}

void stream_plan::abort() noexcept {
    _aborted = true;
    try {
        _coordinator->abort_all_stream_sessions();
    } catch (...) {
        sslog.error("[Stream #{}] Failed to abort stream plan: {}", _plan_id, std::current_exception());
    }
}

} // namespace streaming
