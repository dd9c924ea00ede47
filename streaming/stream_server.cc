/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>

#include "log.hh"
#include "streaming/stream_server.hh"
#include "streaming/stream_manager.hh"
#include "streaming/messages/stream_init_message.hh"

namespace streaming {

static logging::logger srvlog("stream_server");

stream_server::stream_server(sharded<stream_manager>& mgr, socket_address addr)
    : _mgr(mgr)
    , _addr(addr) {
}

stream_server::~stream_server() = default;

future<> stream_server::listen() {
    listen_options lo;
    lo.reuse_address = true;
    try {
        _listener = seastar::listen(_addr, lo);
    } catch (...) {
        throw std::runtime_error(format("stream_server error while listening on {} -> {}", _addr, std::current_exception()));
    }
    srvlog.info("Listening for streaming connections on {}", _addr);
    _listener_stopped = do_accepts();
    return make_ready_future<>();
}

future<> stream_server::stop() {
    if (_gate.is_closed()) {
        co_return;
    }
    auto handshakes_done = _gate.close();
    if (_listener) {
        srvlog.debug("abort accept on {}", _addr);
        _listener->abort_accept();
    }
    co_await std::move(_listener_stopped);
    srvlog.debug("Shutting down {} connections in handshake", _pending.size());
    for (auto& conn : _pending) {
        conn.fd.shutdown_input();
    }
    co_await std::move(handshakes_done);
}

future<> stream_server::do_accepts() {
    while (!_gate.is_closed()) {
        try {
            seastar::gate::holder holder(_gate);
            accept_result cs_sa = co_await _listener->accept();
            if (_gate.is_closed()) {
                break;
            }
            auto fd = std::move(cs_sa.connection);
            fd.set_nodelay(true);
            _total_connections++;
            // Move the processing into the background.
            (void)handle_connection(std::move(fd), std::move(cs_sa.remote_address)).finally([holder = std::move(holder)] {});
        } catch (...) {
            srvlog.debug("accept failed: {}", std::current_exception());
        }
    }
}

void stream_server::unlink(pending_connection& conn) noexcept {
    if (conn.is_linked()) {
        _pending.erase(_pending.iterator_to(conn));
    }
}

future<> stream_server::handle_connection(connected_socket fd, socket_address remote) {
    pending_connection conn(std::move(fd), remote);
    _pending.push_back(conn);
    bool handed_over = false;
    try {
        auto version = co_await messages::read_version(conn.in);
        if (!version) {
            srvlog.debug("Connection from {} closed before sending a protocol version", remote);
        } else if (*version != messages::current_version) {
            _rejected_connections++;
            srvlog.warn("Rejecting streaming connection from {}: peer speaks protocol version {}, this node speaks version {}",
                    remote, *version, messages::current_version);
        } else {
            auto init = co_await messages::read_init_message(conn.in, *version);
            srvlog.debug("[Stream #{}] Got stream init from {} ({}), description={}, reason={}",
                    init.plan_id, init.from, remote, init.description, init.reason);
            if (co_await _mgr.local().is_receiving_on_any_shard(init.plan_id)) {
                _rejected_connections++;
                srvlog.warn("[Stream #{}] Rejecting connection from {}: the plan is already streaming, duplicated connection?",
                        init.plan_id, remote);
            } else {
                unlink(conn);
                // Takes the connection only once the session is set up
                _mgr.local().accept_session(init, std::move(conn.fd), std::move(conn.in), std::move(conn.out), *version);
                handed_over = true;
            }
        }
    } catch (...) {
        _rejected_connections++;
        srvlog.warn("Failed to set up stream session for connection from {}: {}", remote, std::current_exception());
    }
    unlink(conn);
    if (handed_over) {
        co_return;
    }
    try {
        co_await conn.out.close();
    } catch (...) {
        srvlog.debug("Failed to close connection from {}: {}", remote, std::current_exception());
    }
    try {
        co_await conn.in.close();
    } catch (...) {
        srvlog.debug("Failed to close connection from {}: {}", remote, std::current_exception());
    }
}

} // namespace streaming
