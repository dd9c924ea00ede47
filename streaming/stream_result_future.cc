/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/stream_result_future.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_exception.hh"
#include "log.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>
#include <cfloat>
#include <cmath>
#include <fmt/ranges.h>

namespace streaming {

extern logging::logger sslog;

future<stream_state> stream_result_future::init_sending_side(stream_manager& mgr, streaming::plan_id plan_id_, sstring description_,
        std::vector<stream_event_handler*> listeners_, shared_ptr<stream_coordinator> coordinator_, failure_policy policy) {
    auto sr = ::make_shared<stream_result_future>(mgr, plan_id_, description_, coordinator_, policy);
    mgr.register_sending(sr);

    for (auto& listener : listeners_) {
        sr->add_event_listener(listener);
    }

    sslog.info("[Stream #{}] Executing streaming plan for {} with peers={}, master", plan_id_, description_, coordinator_->get_peers());

    coordinator_->init_all_stream_sessions(sr);
    auto f = sr->get_future();
    sr->start();
    coordinator_->connect_all_stream_sessions();
    return f;
}

shared_ptr<stream_session> stream_result_future::init_receiving_side(stream_manager& mgr, const messages::stream_init_message& init) {
    auto sr = mgr.get_receiving_stream(init.plan_id);
    if (sr) {
        auto err = fmt::format("[Stream #{}] GOT STREAM_INIT from {}, description={}, "
                          "stream_plan exists, duplicated connection?", init.plan_id, init.from, init.description);
        sslog.warn("{}", err);
        throw std::runtime_error(err);
    }
    sslog.info("[Stream #{}] Executing streaming plan for {} with peers={}, slave", init.plan_id, init.description, init.from);
    sr = ::make_shared<stream_result_future>(mgr, init.plan_id, init.description, make_shared<stream_coordinator>());
    auto session = sr->_coordinator->get_or_create_session(mgr, init.from);
    session->set_reason(init.reason);
    session->init(sr);
    mgr.register_receiving(sr);
    sr->start();
    return session;
}

void stream_result_future::start() {
    auto holder = _mgr.hold_background();
    (void)run().finally([holder = std::move(holder), self = shared_from_this()] {});
}

future<> stream_result_future::run() {
    auto sessions = _coordinator->get_all_stream_sessions();
    co_await parallel_for_each(sessions, [this] (shared_ptr<stream_session> session) {
        return session->wait_closed().then([this, session] (stream_session_state state) {
            if (state == stream_session_state::FAILED && _policy == failure_policy::fail_fast) {
                sslog.warn("[Stream #{}] Session with {} failed, aborting the other sessions of the plan", plan_id, session->peer);
                _coordinator->abort_all_stream_sessions();
            }
        });
    });
    sslog.debug("[Stream #{}] stream_result_future: all {} sessions closed", plan_id, sessions.size());
    if (sslog.is_enabled(logging::log_level::debug)) {
        _mgr.show_streams();
    }
    auto stats = co_await transfer_stats();
    auto final_state = get_current_state();
    if (final_state.has_failed_session()) {
        sslog.warn("[Stream #{}] Streaming plan for {} failed, peers={}, failed={}, {}", plan_id, description, _coordinator->get_peers(), final_state.failed_peers(), stats);
        _done.set_exception(stream_exception(final_state, "Stream failed"));
    } else {
        sslog.info("[Stream #{}] Streaming plan for {} succeeded, peers={}, {}", plan_id, description, _coordinator->get_peers(), stats);
        _done.set_value(final_state);
    }
}

future<sstring> stream_result_future::transfer_stats() const {
    auto duration = std::chrono::duration_cast<std::chrono::duration<float>>(lowres_clock::now() - _start_time).count();
    try {
        auto sbytes = co_await _mgr.get_progress_on_all_shards(plan_id);
        auto tx_bw = sstring("0");
        auto rx_bw = sstring("0");
        if (std::fabs(duration) > FLT_EPSILON) {
            tx_bw = format("{:.2f}", sbytes.bytes_sent / duration / 1024);
            rx_bw = format("{:.2f}", sbytes.bytes_received  / duration / 1024);
        }
        co_return format("tx={:d} KiB, {} KiB/s, rx={:d} KiB, {} KiB/s", sbytes.bytes_sent / 1024, tx_bw, sbytes.bytes_received / 1024, rx_bw);
    } catch (...) {
        sslog.warn("[Stream #{}] Fail to get progress on all shards: {}", plan_id, std::current_exception());
    }
    co_return sstring();
}

void stream_result_future::handle_session_prepared(shared_ptr<stream_session> session) {
    auto si = session->make_session_info();
    sslog.debug("[Stream #{}] Prepare completed with {}. Receiving {}, sending {}",
               session->plan_id(),
               session->peer,
               si.files_expected(progress_info::direction::IN),
               si.files_expected(progress_info::direction::OUT));
    fire_stream_event(session_prepared_event(plan_id, std::move(si)));
}

void stream_result_future::handle_session_complete(shared_ptr<stream_session> session) {
    sslog.debug("[Stream #{}] Session with {} is complete, state={}", session->plan_id(), session->peer, session->get_state());
    fire_stream_event(session_complete_event(plan_id, session->peer, session->is_success()));
}

template <typename Event>
void stream_result_future::fire_stream_event(Event event) {
    // delegate to listener
    for (auto listener : _event_listeners) {
        listener->handle_stream_event(event);
    }
}

stream_state stream_result_future::get_current_state() const {
    return stream_state(plan_id, description, _coordinator->get_all_session_info());
}

void stream_result_future::handle_progress(progress_info progress) {
    fire_stream_event(progress_event(plan_id, std::move(progress)));
}

} // namespace streaming
