/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once
#include "streaming/stream_fwd.hh"
#include "streaming/progress_info.hh"
#include "streaming/stream_reason.hh"
#include "streaming/stream_rate_limiter.hh"
#include "streaming/messages/stream_init_message.hh"
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/distributed.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/iostream.hh>
#include <seastar/net/api.hh>
#include "utils/updateable_value.hh"
#include "gms/inet_address.hh"
#include <seastar/core/metrics_registration.hh>
#include <unordered_map>

namespace db {
class config;
}

namespace streaming {

class data_source;
class data_sink;

struct stream_bytes {
    int64_t bytes_sent = 0;
    int64_t bytes_received = 0;
    friend stream_bytes operator+(const stream_bytes& x, const stream_bytes& y) {
        stream_bytes ret(x);
        ret += y;
        return ret;
    }
    stream_bytes& operator+=(const stream_bytes& x) {
        bytes_sent += x.bytes_sent;
        bytes_received += x.bytes_received;
        return *this;
    }
};

/**
 * StreamManager manages currently running {@link StreamResultFuture}s and provides status of all operation invoked.
 *
 * All stream operation should be created through this class to track streaming status and progress.
 *
 * Every shard has its own instance. A plan lives on the shard that executed
 * or accepted it, so cross-shard queries go through container().
 */
class stream_manager : public peering_sharded_service<stream_manager> {
    using inet_address = gms::inet_address;
    /*
     * Currently running streams. Removed after completion/failure.
     * We manage them in two different maps to distinguish plan from initiated ones to
     * receiving ones within the same process.
     */
private:
    inet_address _listen_address;
    uint16_t _port;
    data_source& _source;
    data_sink& _sink;

    std::unordered_map<plan_id, shared_ptr<stream_result_future>> _initiated_streams;
    std::unordered_map<plan_id, shared_ptr<stream_result_future>> _receiving_streams;
    std::unordered_map<plan_id, std::unordered_map<gms::inet_address, stream_bytes>> _stream_bytes;
    uint64_t _total_incoming_bytes{0};
    uint64_t _total_outgoing_bytes{0};
    seastar::metrics::metric_groups _metrics;

    stream_rate_limiter_registry _rate_limiters;
    utils::updateable_value<uint32_t> _max_streaming_retries;
    utils::updateable_value<uint32_t> _chunk_size_in_kb;
    // Sessions, result aggregation and registry observers
    seastar::gate _background;

public:
    stream_manager(db::config& cfg, inet_address listen_address, data_source& source, data_sink& sink);

    future<> stop();

    void register_sending(shared_ptr<stream_result_future> result);

    void register_receiving(shared_ptr<stream_result_future> result);

    shared_ptr<stream_result_future> get_sending_stream(streaming::plan_id plan_id) const;

    shared_ptr<stream_result_future> get_receiving_stream(streaming::plan_id plan_id) const;

    std::vector<shared_ptr<stream_result_future>> get_all_streams() const;

    const std::unordered_map<plan_id, shared_ptr<stream_result_future>>& get_initiated_streams() const {
        return _initiated_streams;
    }

    const std::unordered_map<plan_id, shared_ptr<stream_result_future>>& get_receiving_streams() const {
        return _receiving_streams;
    }

    // Ids of the plans of this shard that have not resolved yet.
    std::vector<streaming::plan_id> get_current_plans() const;

    // State snapshots of the plans of this shard that have not resolved yet.
    std::vector<stream_state> get_current_status() const;

    future<std::vector<streaming::plan_id>> get_current_plans_on_all_shards() const;

    future<std::vector<stream_state>> get_current_status_on_all_shards() const;

    void remove_stream(streaming::plan_id plan_id);

    void show_streams() const;

    // Accepted connection with a valid version byte and handshake. Starts
    // the follower side of the plan. Throws if the plan is already known on
    // this shard or the manager is stopping; the connection is not touched
    // then and stays with the caller.
    void accept_session(const messages::stream_init_message& init, connected_socket&& socket,
            input_stream<char>&& in, output_stream<char>&& out, messages::protocol_version version);

    future<bool> is_receiving_on_any_shard(streaming::plan_id plan_id) const;

    void update_progress(streaming::plan_id plan_id, gms::inet_address peer, progress_info::direction dir, size_t fm_size);

    void remove_progress(streaming::plan_id plan_id);

    stream_bytes get_progress(streaming::plan_id plan_id, gms::inet_address peer) const;

    stream_bytes get_progress(streaming::plan_id plan_id) const;

    future<> remove_progress_on_all_shards(streaming::plan_id plan_id);

    future<stream_bytes> get_progress_on_all_shards(streaming::plan_id plan_id, gms::inet_address peer) const;

    future<stream_bytes> get_progress_on_all_shards(streaming::plan_id plan_id) const;

    future<stream_bytes> get_progress_on_all_shards(gms::inet_address peer) const;

    future<stream_bytes> get_progress_on_all_shards() const;

    stream_bytes get_progress_on_local_shard() const;

    // Fails every session with the peer, on every shard.
    future<> fail_sessions_on_all_shards(inet_address endpoint);

    void fail_sessions(inet_address endpoint);
    void fail_all_sessions();
    bool has_peer(inet_address endpoint) const;

public:
    const inet_address& listen_address() const noexcept {
        return _listen_address;
    }

    uint16_t port() const noexcept {
        return _port;
    }

    data_source& source() noexcept {
        return _source;
    }

    data_sink& sink() noexcept {
        return _sink;
    }

    stream_rate_limiter_registry& rate_limiters() noexcept {
        return _rate_limiters;
    }

    uint32_t max_streaming_retries() const {
        return _max_streaming_retries();
    }

    // Bytes sent or read at once while moving file data.
    size_t chunk_size() const {
        return std::max<size_t>(_chunk_size_in_kb(), 1) * 1024;
    }

    // Keeps stop() waiting. Throws gate_closed_exception once stopping.
    seastar::gate::holder hold_background() {
        return _background.hold();
    }

private:
    future<> remove_when_resolved(streaming::plan_id plan_id, future<stream_state> result, seastar::gate::holder holder);
};

} // namespace streaming
