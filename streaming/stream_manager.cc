/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/core/distributed.hh>
#include "streaming/stream_manager.hh"
#include "streaming/stream_result_future.hh"
#include "streaming/stream_exception.hh"
#include "log.hh"
#include "streaming/stream_session_state.hh"
#include <seastar/core/metrics.hh>
#include <seastar/core/coroutine.hh>
#include <functional>
#include "db/config.hh"

namespace streaming {

extern logging::logger sslog;

stream_manager::stream_manager(db::config& cfg, inet_address listen_address, data_source& source, data_sink& sink)
        : _listen_address(listen_address)
        , _port(cfg.streaming_port())
        , _source(source)
        , _sink(sink)
        , _rate_limiters(cfg.stream_throughput_outbound_megabits_per_sec)
        , _max_streaming_retries(cfg.max_streaming_retries)
        , _chunk_size_in_kb(cfg.streaming_chunk_size_in_kb)
{
    namespace sm = seastar::metrics;
    // Several nodes may run in one process (tests), tell them apart.
    auto node_label = sm::label("node");
    std::vector<sm::label_instance> labels{node_label(fmt::to_string(listen_address))};

    _metrics.add_group("streaming", {
        sm::make_counter("total_incoming_bytes", [this] { return _total_incoming_bytes; },
                        sm::description("Total number of bytes received on this shard."), labels),

        sm::make_counter("total_outgoing_bytes", [this] { return _total_outgoing_bytes; },
                        sm::description("Total number of bytes sent on this shard."), labels),

        sm::make_gauge("active_plans", [this] { return _initiated_streams.size() + _receiving_streams.size(); },
                        sm::description("Number of stream plans running on this shard."), labels),
    });
}

future<> stream_manager::stop() {
    sslog.info("stream_manager: stopping, failing {} plans", _initiated_streams.size() + _receiving_streams.size());
    fail_all_sessions();
    co_await _background.close();
    _metrics.clear();
}

void stream_manager::register_sending(shared_ptr<stream_result_future> result) {
    auto holder = _background.hold();
    auto id = result->plan_id;
    auto f = result->get_future();
    _initiated_streams[id] = std::move(result);
    (void)remove_when_resolved(id, std::move(f), std::move(holder));
}

void stream_manager::register_receiving(shared_ptr<stream_result_future> result) {
    auto holder = _background.hold();
    auto id = result->plan_id;
    auto f = result->get_future();
    _receiving_streams[id] = std::move(result);
    (void)remove_when_resolved(id, std::move(f), std::move(holder));
}

future<> stream_manager::remove_when_resolved(streaming::plan_id plan_id, future<stream_state> result, seastar::gate::holder holder) {
    auto id = plan_id;
    try {
        auto state = co_await std::move(result);
        id = state.plan_id;
    } catch (const stream_exception& e) {
        id = e.state.plan_id;
    } catch (...) {
        sslog.warn("[Stream #{}] Stream plan failed: {}", plan_id, std::current_exception());
    }
    remove_stream(id);
}

shared_ptr<stream_result_future> stream_manager::get_sending_stream(streaming::plan_id plan_id) const {
    auto it = _initiated_streams.find(plan_id);
    if (it != _initiated_streams.end()) {
        return it->second;
    }
    return {};
}

shared_ptr<stream_result_future> stream_manager::get_receiving_stream(streaming::plan_id plan_id) const {
    auto it = _receiving_streams.find(plan_id);
    if (it != _receiving_streams.end()) {
        return it->second;
    }
    return {};
}

void stream_manager::remove_stream(streaming::plan_id plan_id) {
    sslog.debug("stream_manager: removing plan_id={}", plan_id);
    _initiated_streams.erase(plan_id);
    _receiving_streams.erase(plan_id);
    // Other shards only hold progress of the plan
    remove_progress(plan_id);
    if (smp::count > 1) {
        try {
            auto holder = _background.hold();
            (void)remove_progress_on_all_shards(plan_id).handle_exception([plan_id] (auto ep) {
                sslog.info("stream_manager: Fail to remove progress for plan_id={}: {}", plan_id, ep);
            }).finally([holder = std::move(holder)] {});
        } catch (const seastar::gate_closed_exception&) {
            sslog.debug("stream_manager: not removing progress of plan_id={} on other shards, stopping", plan_id);
        }
    }
}

void stream_manager::show_streams() const {
    for (auto const& x : _initiated_streams) {
        sslog.debug("stream_manager:initiated_stream: plan_id={}", x.first);
    }
    for (auto const& x : _receiving_streams) {
        sslog.debug("stream_manager:receiving_stream: plan_id={}", x.first);
    }
}

std::vector<shared_ptr<stream_result_future>> stream_manager::get_all_streams() const {
    std::vector<shared_ptr<stream_result_future>> result;
    for (auto& x : _initiated_streams) {
        result.push_back(x.second);
    }
    for (auto& x : _receiving_streams) {
        result.push_back(x.second);
    }
    return result;
}

std::vector<streaming::plan_id> stream_manager::get_current_plans() const {
    std::vector<streaming::plan_id> ret;
    ret.reserve(_initiated_streams.size() + _receiving_streams.size());
    for (auto& x : _initiated_streams) {
        ret.push_back(x.first);
    }
    for (auto& x : _receiving_streams) {
        ret.push_back(x.first);
    }
    return ret;
}

std::vector<stream_state> stream_manager::get_current_status() const {
    std::vector<stream_state> ret;
    for (auto& sr : get_all_streams()) {
        ret.push_back(sr->get_current_state());
    }
    return ret;
}

future<std::vector<streaming::plan_id>> stream_manager::get_current_plans_on_all_shards() const {
    return container().map_reduce0(
        [] (const stream_manager& sm) {
            return sm.get_current_plans();
        },
        std::vector<streaming::plan_id>(),
        [] (std::vector<streaming::plan_id> a, std::vector<streaming::plan_id> b) {
            a.insert(a.end(), b.begin(), b.end());
            return a;
        }
    );
}

future<std::vector<stream_state>> stream_manager::get_current_status_on_all_shards() const {
    return container().map_reduce0(
        [] (const stream_manager& sm) {
            return sm.get_current_status();
        },
        std::vector<stream_state>(),
        [] (std::vector<stream_state> a, std::vector<stream_state> b) {
            std::move(b.begin(), b.end(), std::back_inserter(a));
            return a;
        }
    );
}

void stream_manager::accept_session(const messages::stream_init_message& init, connected_socket&& socket,
        input_stream<char>&& in, output_stream<char>&& out, messages::protocol_version version) {
    auto holder = _background.hold();
    auto session = stream_result_future::init_receiving_side(*this, init);
    (void)session->accept(std::move(socket), std::move(in), std::move(out), version).finally([holder = std::move(holder), session] {});
}

future<bool> stream_manager::is_receiving_on_any_shard(streaming::plan_id plan_id) const {
    return container().map_reduce0([plan_id] (const stream_manager& sm) {
        return bool(sm.get_receiving_stream(plan_id));
    }, false, std::logical_or<bool>());
}

void stream_manager::update_progress(streaming::plan_id plan_id, gms::inet_address peer, progress_info::direction dir, size_t fm_size) {
    auto& sbytes = _stream_bytes[plan_id];
    if (dir == progress_info::direction::OUT) {
        sbytes[peer].bytes_sent += fm_size;
        _total_outgoing_bytes += fm_size;
    } else {
        sbytes[peer].bytes_received += fm_size;
        _total_incoming_bytes += fm_size;
    }
}

void stream_manager::remove_progress(streaming::plan_id plan_id) {
    _stream_bytes.erase(plan_id);
}

stream_bytes stream_manager::get_progress(streaming::plan_id plan_id, gms::inet_address peer) const {
    auto it = _stream_bytes.find(plan_id);
    if (it == _stream_bytes.end()) {
        return stream_bytes();
    }
    auto const& sbytes = it->second;
    auto i = sbytes.find(peer);
    if (i == sbytes.end()) {
        return stream_bytes();
    }
    return i->second;
}

stream_bytes stream_manager::get_progress(streaming::plan_id plan_id) const {
    auto it = _stream_bytes.find(plan_id);
    if (it == _stream_bytes.end()) {
        return stream_bytes();
    }
    stream_bytes ret;
    for (auto const& x : it->second) {
        ret += x.second;
    }
    return ret;
}

future<> stream_manager::remove_progress_on_all_shards(streaming::plan_id plan_id) {
    return container().invoke_on_all([plan_id] (auto& sm) {
        sm.remove_progress(plan_id);
    });
}

future<stream_bytes> stream_manager::get_progress_on_all_shards(streaming::plan_id plan_id, gms::inet_address peer) const {
    return container().map_reduce0(
        [plan_id, peer] (auto& sm) {
            return sm.get_progress(plan_id, peer);
        },
        stream_bytes(),
        std::plus<stream_bytes>()
    );
}

future<stream_bytes> stream_manager::get_progress_on_all_shards(streaming::plan_id plan_id) const {
    return container().map_reduce0(
        [plan_id] (auto& sm) {
            return sm.get_progress(plan_id);
        },
        stream_bytes(),
        std::plus<stream_bytes>()
    );
}

future<stream_bytes> stream_manager::get_progress_on_all_shards(gms::inet_address peer) const {
    return container().map_reduce0(
        [peer] (auto& sm) {
            stream_bytes ret;
            for (auto& sbytes : sm._stream_bytes) {
                if (sbytes.second.contains(peer)) {
                    ret += sbytes.second.at(peer);
                }
            }
            return ret;
        },
        stream_bytes(),
        std::plus<stream_bytes>()
    );
}

future<stream_bytes> stream_manager::get_progress_on_all_shards() const {
    return container().map_reduce0(
        [] (auto& sm) {
            return sm.get_progress_on_local_shard();
        },
        stream_bytes(),
        std::plus<stream_bytes>()
    );
}

stream_bytes stream_manager::get_progress_on_local_shard() const {
    stream_bytes ret;
    for (auto const& sbytes : _stream_bytes) {
        for (auto const& sb : sbytes.second) {
            ret += sb.second;
        }
    }
    return ret;
}

bool stream_manager::has_peer(inet_address endpoint) const {
    for (auto sr : get_all_streams()) {
        for (auto session : sr->get_coordinator()->get_all_stream_sessions()) {
            if (session->peer == endpoint) {
                return true;
            }
        }
    }
    return false;
}

void stream_manager::fail_sessions(inet_address endpoint) {
    for (auto sr : get_all_streams()) {
        for (auto session : sr->get_coordinator()->get_all_stream_sessions()) {
            if (session->peer == endpoint) {
                session->close_session(stream_session_state::FAILED);
            }
        }
    }
}

void stream_manager::fail_all_sessions() {
    for (auto sr : get_all_streams()) {
        for (auto session : sr->get_coordinator()->get_all_stream_sessions()) {
            session->close_session(stream_session_state::FAILED);
        }
    }
}

future<> stream_manager::fail_sessions_on_all_shards(inet_address endpoint) {
    sslog.info("stream_manager: Close all stream_session with peer = {}", endpoint);
    return container().invoke_on_all([endpoint] (auto& sm) {
        sm.fail_sessions(endpoint);
    });
}

} // namespace streaming
