/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>

#include <seastar/core/distributed.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/iostream.hh>
#include <seastar/net/api.hh>
#include <boost/intrusive/list.hpp>

#include "seastarx.hh"

namespace streaming {

class stream_manager;

// Accepts streaming connections from other nodes.
//
// Runs on every shard. A connection starts with the protocol version byte
// and a stream_init_message; once both were read the connection is handed
// to the stream_manager of the shard, which runs the follower side of the
// plan over it. A connection speaking another protocol version is closed
// without creating a session.
class stream_server {
    // A connection whose handshake is still being read
    struct pending_connection : public boost::intrusive::list_base_hook<> {
        connected_socket fd;
        input_stream<char> in;
        output_stream<char> out;
        socket_address remote;

        pending_connection(connected_socket&& fd_, socket_address remote_)
            : fd(std::move(fd_))
            , in(fd.input())
            , out(fd.output())
            , remote(std::move(remote_)) {
        }
    };

    sharded<stream_manager>& _mgr;
    socket_address _addr;
    seastar::gate _gate;
    std::optional<server_socket> _listener;
    future<> _listener_stopped = make_ready_future<>();
    boost::intrusive::list<pending_connection> _pending;
    uint64_t _total_connections = 0;
    uint64_t _rejected_connections = 0;
public:
    stream_server(sharded<stream_manager>& mgr, socket_address addr);
    ~stream_server();

    future<> listen();
    // Stops accepting and waits for the handshakes in progress. Sessions
    // already handed over are stopped with the stream_manager.
    future<> stop();

    uint64_t total_connections() const noexcept {
        return _total_connections;
    }

    // Connections closed because of an unsupported protocol version or a
    // bad handshake.
    uint64_t rejected_connections() const noexcept {
        return _rejected_connections;
    }
private:
    future<> do_accepts();
    future<> handle_connection(connected_socket fd, socket_address remote);
    void unlink(pending_connection& conn) noexcept;
};

} // namespace streaming
