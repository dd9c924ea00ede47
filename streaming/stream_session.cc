/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <algorithm>

#include <seastar/core/coroutine.hh>
#include <seastar/core/gate.hh>
#include <seastar/net/api.hh>

#include "log.hh"
#include "streaming/stream_session.hh"
#include "streaming/stream_result_future.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_exception.hh"
#include "streaming/streaming_database_interface.hh"
#include "streaming/messages/stream_init_message.hh"
#include "streaming/messages/retry_message.hh"
#include "streaming/messages/complete_message.hh"

namespace streaming {

logging::logger sslog("stream_session");

using smt = messages::stream_message_type;

stream_session::stream_session(stream_manager& mgr, inet_address peer_)
    : peer(peer_)
    , _mgr(mgr)
    , _session_info(peer_, {}, {}, stream_session_state::INITIALIZED) {
}

stream_session::~stream_session() = default;

streaming::plan_id stream_session::plan_id() const {
    return _plan_id;
}

sstring stream_session::description() const {
    return _description;
}

void stream_session::init(shared_ptr<stream_result_future> stream_result_) {
    _plan_id = stream_result_->plan_id;
    _description = stream_result_->description;
    _stream_result = std::move(stream_result_);
}

bool stream_session::is_initialized() const {
    return bool(_plan_id);
}

void stream_session::start() {
    if (_requests.empty() && _transfer_requests.empty()) {
        sslog.info("[Stream #{}] Session does not have any tasks.", plan_id());
        close_session(stream_session_state::COMPLETE);
        return;
    }
    std::optional<seastar::gate::holder> holder;
    try {
        holder.emplace(_mgr.hold_background());
    } catch (...) {
        on_error(std::current_exception());
        return;
    }
    sslog.info("[Stream #{}] Starting streaming to {}", plan_id(), peer);
    (void)initiate().finally([holder = std::move(*holder), self = shared_from_this()] {});
}

future<> stream_session::initiate() {
    try {
        co_await add_transfer_files(std::exchange(_transfer_requests, {}));
        if (_is_aborted) {
            co_return;
        }
        if (_requests.empty() && _transfers.empty()) {
            sslog.info("[Stream #{}] No files to stream to {} and nothing to request.", plan_id(), peer);
            close_session(stream_session_state::COMPLETE);
            co_return;
        }
        auto addr = peer.to_socket_address(_mgr.port());
        sslog.debug("[Stream #{}] Connecting to {}", plan_id(), addr);
        auto s = co_await seastar::connect(addr);
        _socket.emplace(std::move(s));
        _in = _socket->input();
        _out = _socket->output();
        if (!_is_aborted) {
            messages::stream_init_message init{_mgr.listen_address(), plan_id(), description(), _reason};
            co_await messages::write_handshake(_out, init, _version);
            set_state(stream_session_state::PREPARING);
            std::vector<stream_summary> summaries;
            for (auto& x : _transfers) {
                summaries.push_back(x.second.get_summary());
            }
            sslog.debug("[Stream #{}] Sending prepare to {}: requests={} summaries={}", plan_id(), peer, _requests.size(), summaries.size());
            send(std::make_unique<messages::prepare_message>(_requests, std::move(summaries)));
        }
    } catch (...) {
        on_error(std::current_exception());
    }
    if (_socket) {
        co_await run_connection();
    }
}

future<> stream_session::accept(connected_socket socket, input_stream<char> in, output_stream<char> out, messages::protocol_version version) {
    _initiator = false;
    _socket.emplace(std::move(socket));
    _in = std::move(in);
    _out = std::move(out);
    _version = version;
    set_state(stream_session_state::PREPARING);
    sslog.info("[Stream #{}] Accepted stream session from {}, reason={}", plan_id(), peer, _reason);
    co_await run_connection();
}

future<> stream_session::run_connection() {
    auto sender = send_loop();
    co_await receive_loop();
    co_await std::move(sender);
    try {
        co_await _in.close();
    } catch (...) {
        sslog.debug("[Stream #{}] Failed to close input from {}: {}", plan_id(), peer, std::current_exception());
    }
    sslog.debug("[Stream #{}] Connection with {} closed, state={}", plan_id(), peer, _state);
}

future<> stream_session::receive_loop() {
    try {
        while (!is_terminal(_state)) {
            auto msg = co_await messages::read_message(_in, _version);
            if (!msg) {
                if (!is_terminal(_state)) {
                    throw std::runtime_error(format("Connection closed by {} in state {}", peer, _state));
                }
                break;
            }
            co_await handle_message(std::move(msg));
        }
    } catch (...) {
        if (is_terminal(_state)) {
            sslog.debug("[Stream #{}] Receive from {} stopped: {}", plan_id(), peer, std::current_exception());
        } else {
            on_error(std::current_exception());
        }
    }
}

future<> stream_session::send_loop() {
    try {
        for (;;) {
            co_await _send_cv.wait([this] { return !_send_queue.empty() || _send_closed; });
            if (_send_queue.empty()) {
                break;
            }
            auto it = _send_queue.begin();
            auto msg = std::move(it->second);
            _send_queue.erase(it);
            co_await send_message(*msg);
        }
    } catch (...) {
        on_error(std::current_exception());
    }
    try {
        co_await _out.close();
    } catch (...) {
        sslog.debug("[Stream #{}] Failed to close output to {}: {}", plan_id(), peer, std::current_exception());
    }
    // Nothing is read once the session is over. Wakes up a pending read.
    shutdown_connection();
}

void stream_session::shutdown_connection() noexcept {
    if (!_socket) {
        return;
    }
    try {
        _socket->shutdown_input();
    } catch (...) {
        sslog.debug("[Stream #{}] Failed to shut down connection with {}: {}", plan_id(), peer, std::current_exception());
    }
}

void stream_session::send(messages::stream_message_ptr msg) {
    if (_send_closed) {
        sslog.debug("[Stream #{}] Not sending {} to {}, session is closed", plan_id(), msg->type(), peer);
        return;
    }
    auto prio = msg->priority();
    _send_queue.emplace(send_order{prio, _send_seq++}, std::move(msg));
    _send_cv.signal();
}

future<> stream_session::send_message(messages::stream_message& msg) {
    if (msg.type() == smt::FILE) {
        co_await send_file(static_cast<messages::file_message&>(msg));
        co_return;
    }
    sslog.debug("[Stream #{}] Sending {} to {}", plan_id(), msg.type(), peer);
    co_await messages::write_message(_out, msg, _version);
    co_await _out.flush();
}

future<> stream_session::send_file(messages::file_message& msg) {
    auto& header = msg.header;
    sslog.debug("[Stream #{}] Sending file {} to {}", plan_id(), header, peer);
    _file_in_flight = true;
    co_await messages::write_message(_out, msg, _version);
    uint64_t chunk_size = _mgr.chunk_size();
    uint64_t sent = 0;
    for (auto [start, end] : header.sections) {
        auto pos = start;
        while (pos < end) {
            if (_is_aborted) {
                // The file is cut short, the peer fails on the broken framing.
                co_return;
            }
            auto len = std::min(chunk_size, end - pos);
            co_await _mgr.rate_limiters().acquire(peer, len);
            auto buf = co_await msg.file->read(pos, len);
            if (buf.size() != len) {
                throw std::runtime_error(format("Short read of {} at position {}: expected {} bytes, got {}", header, pos, len, buf.size()));
            }
            co_await _out.write(std::move(buf));
            pos += len;
            sent += len;
            add_bytes_sent(len);
            _mgr.update_progress(plan_id(), peer, progress_info::direction::OUT, len);
            update_progress(header, progress_info::direction::OUT, sent);
        }
    }
    co_await _out.flush();
    _file_in_flight = false;
    sslog.debug("[Stream #{}] Sent file {} to {}", plan_id(), header, peer);
}

future<> stream_session::handle_message(messages::stream_message_ptr msg) {
    sslog.trace("[Stream #{}] Got {} from {}", plan_id(), msg->type(), peer);
    switch (msg->type()) {
    case smt::PREPARE: {
        auto& m = static_cast<messages::prepare_message&>(*msg);
        if (_state != stream_session_state::PREPARING) {
            throw protocol_exception(format("[Stream #{}] Unexpected prepare message from {} in state {}", plan_id(), peer, _state));
        }
        if (_initiator) {
            handle_prepare_reply(std::move(m));
        } else {
            auto reply = co_await prepare(std::move(m.requests), std::move(m.summaries));
            if (_is_aborted) {
                break;
            }
            send(std::make_unique<messages::prepare_message>(std::move(reply)));
            start_streaming_files();
        }
        break;
    }
    case smt::FILE:
        co_await receive_file(static_cast<messages::file_message&>(*msg));
        break;
    case smt::RETRY: {
        auto& m = static_cast<messages::retry_message&>(*msg);
        handle_retry(m.cf_id, m.sequence_number);
        break;
    }
    case smt::COMPLETE:
        complete();
        break;
    case smt::SESSION_FAILED:
        received_failed_complete_message();
        break;
    }
}

future<> stream_session::add_transfer_files(std::vector<stream_request> requests) {
    auto& source = _mgr.source();
    for (auto& request : requests) {
        std::vector<table_info> tables;
        if (request.column_families.empty()) {
            tables = source.tables(request.keyspace);
        } else {
            for (auto& cf_name : request.column_families) {
                auto table = source.find_table(request.keyspace, cf_name);
                if (!table) {
                    log_warning_and_throw<std::runtime_error>(sslog, "[Stream #{}] Streaming of ks={} cf={} requested, but cf does not exist",
                            plan_id(), request.keyspace, cf_name);
                }
                tables.push_back(std::move(*table));
            }
        }
        for (auto& table : tables) {
            auto files = co_await source.get_files(table.id, request.ranges);
            for (auto& file : files) {
                if (file->sections().empty()) {
                    continue;
                }
                auto sections = file->sections();
                auto estimated_keys = file->estimated_keys();
                get_or_create_transfer_task(table.id).add_transfer_file(std::move(file), estimated_keys, std::move(sections));
            }
        }
    }
}

stream_transfer_task& stream_session::get_or_create_transfer_task(table_id cf_id) {
    auto it = _transfers.find(cf_id);
    if (it == _transfers.end()) {
        it = _transfers.emplace(cf_id, stream_transfer_task(shared_from_this(), cf_id)).first;
    }
    return it->second;
}

future<messages::prepare_message> stream_session::prepare(std::vector<stream_request> requests, std::vector<stream_summary> summaries) {
    auto& source = _mgr.source();
    sslog.debug("[Stream #{}] prepare requests nr={}, summaries nr={}", plan_id(), requests.size(), summaries.size());
    // Reject an unknown table before anything is set up
    for (auto& request : requests) {
        for (auto& cf_name : request.column_families) {
            if (!source.find_table(request.keyspace, cf_name)) {
                log_warning_and_throw<std::runtime_error>(sslog, "[Stream #{}] prepare requested ks={} cf={}, but cf does not exist",
                        plan_id(), request.keyspace, cf_name);
            }
        }
    }
    for (auto& summary : summaries) {
        if (!source.has_table(summary.cf_id)) {
            log_warning_and_throw<std::runtime_error>(sslog, "[Stream #{}] prepare cf_id={} announced by {} does not exist",
                    plan_id(), summary.cf_id, peer);
        }
    }
    co_await add_transfer_files(std::move(requests));
    for (auto& summary : summaries) {
        prepare_receiving(summary);
    }
    messages::prepare_message reply;
    for (auto& x : _transfers) {
        reply.summaries.push_back(x.second.get_summary());
    }
    co_return reply;
}

void stream_session::handle_prepare_reply(messages::prepare_message msg) {
    if (!msg.requests.empty()) {
        throw protocol_exception(format("[Stream #{}] Prepare reply from {} carries {} requests", plan_id(), peer, msg.requests.size()));
    }
    for (auto& summary : msg.summaries) {
        if (!_mgr.source().has_table(summary.cf_id)) {
            log_warning_and_throw<std::runtime_error>(sslog, "[Stream #{}] prepare cf_id={} announced by {} does not exist",
                    plan_id(), summary.cf_id, peer);
        }
        prepare_receiving(summary);
    }
    start_streaming_files();
}

void stream_session::prepare_receiving(const stream_summary& summary) {
    if (summary.files > 0) {
        _receivers.emplace(summary.cf_id, stream_receive_task(shared_from_this(), summary.cf_id, summary.files, summary.total_size));
    }
}

void stream_session::start_streaming_files() {
    sslog.debug("[Stream #{}] {}: {} transfers to send, {} receivers", plan_id(), __func__, _transfers.size(), _receivers.size());
    set_state(stream_session_state::STREAMING);
    _session_info.sending_summaries.clear();
    for (auto& x : _transfers) {
        _session_info.sending_summaries.push_back(x.second.get_summary());
    }
    _session_info.receiving_summaries.clear();
    for (auto& x : _receivers) {
        _session_info.receiving_summaries.push_back(x.second.get_summary());
    }
    _session_info.state = _state;
    if (_stream_result) {
        _stream_result->handle_session_prepared(shared_from_this());
    }
    for (auto& x : _transfers) {
        sslog.debug("[Stream #{}] Start to send cf_id={}", plan_id(), x.first);
        for (auto& msg : x.second.get_file_messages()) {
            send(std::make_unique<messages::file_message>(std::move(msg)));
        }
    }
    maybe_completed();
}

future<> stream_session::receive_file(messages::file_message& msg) {
    auto& header = msg.header;
    if (!_receivers.contains(header.cf_id)) {
        throw protocol_exception(format("[Stream #{}] Got unexpected file {} from {}", plan_id(), header, peer));
    }
    sslog.debug("[Stream #{}] Receiving file {} from {}", plan_id(), header, peer);

    std::unique_ptr<incoming_file_writer> writer;
    std::exception_ptr store_error;
    std::exception_ptr io_error;
    try {
        writer = co_await _mgr.sink().make_writer(header);
    } catch (...) {
        store_error = std::current_exception();
    }
    try {
        uint64_t chunk_size = _mgr.chunk_size();
        uint64_t remaining = header.size;
        // The bytes are read off the connection even when storing failed,
        // so the next message is found.
        while (remaining) {
            auto buf = co_await _in.read_up_to(std::min(remaining, chunk_size));
            if (buf.empty()) {
                throw protocol_exception(format("Connection closed in the middle of file {}", header));
            }
            remaining -= buf.size();
            add_bytes_received(buf.size());
            _mgr.update_progress(plan_id(), peer, progress_info::direction::IN, buf.size());
            update_progress(header, progress_info::direction::IN, header.size - remaining);
            if (!store_error) {
                try {
                    co_await writer->write(std::move(buf));
                } catch (...) {
                    store_error = std::current_exception();
                }
            }
        }
        if (!store_error) {
            try {
                co_await writer->commit();
            } catch (...) {
                store_error = std::current_exception();
            }
        }
    } catch (...) {
        io_error = std::current_exception();
    }
    if ((io_error || store_error) && writer) {
        try {
            co_await writer->abort();
        } catch (...) {
            sslog.warn("[Stream #{}] Failed to discard partial file {}: {}", plan_id(), header, std::current_exception());
        }
    }
    if (io_error) {
        std::rethrow_exception(io_error);
    }
    if (store_error) {
        receive_failed(header, store_error);
        co_return;
    }
    sslog.debug("[Stream #{}] Received file {} from {}", plan_id(), header, peer);
    auto it = _receivers.find(header.cf_id);
    if (it != _receivers.end()) {
        it->second.received(header.sequence_number);
    }
}

void stream_session::receive_failed(const messages::file_message_header& header, std::exception_ptr ep) {
    auto max_retries = _mgr.max_streaming_retries();
    auto& retries = _retries[{header.cf_id, header.sequence_number}];
    if (retries >= max_retries) {
        throw std::runtime_error(format("Failed to receive file {} from {} after {} retries: {}", header, peer, retries, ep));
    }
    ++retries;
    sslog.warn("[Stream #{}] Failed to receive file {} from {}, asking for retry {} of {}: {}",
            plan_id(), header, peer, retries, max_retries, ep);
    send(std::make_unique<messages::retry_message>(header.cf_id, header.sequence_number));
}

void stream_session::handle_retry(table_id cf_id, uint32_t sequence_number) {
    auto it = _transfers.find(cf_id);
    if (it == _transfers.end()) {
        sslog.info("[Stream #{}] Ignoring retry of seq={} cf_id={} from {}: nothing pending for the table", plan_id(), sequence_number, cf_id, peer);
        return;
    }
    try {
        auto msg = it->second.create_message_for_retry(sequence_number);
        sslog.info("[Stream #{}] Sending file {} to {} again", plan_id(), msg.header, peer);
        send(std::make_unique<messages::file_message>(std::move(msg)));
    } catch (no_such_file_exception& e) {
        sslog.info("[Stream #{}] Ignoring retry from {}: {}", plan_id(), peer, e.what());
    }
}

void stream_session::update_progress(const messages::file_message_header& header, progress_info::direction dir, uint64_t current) {
    progress_info progress(peer, format("{}/{}/{}", header.keyspace, header.table, header.file_name), dir, current, header.size);
    _session_info.update_progress(progress);
    if (_stream_result) {
        _stream_result->handle_progress(std::move(progress));
    }
}

void stream_session::received_failed_complete_message() {
    sslog.info("[Stream #{}] Received failed complete message, peer={}", plan_id(), peer);
    _received_failed_complete_message = true;
    close_session(stream_session_state::FAILED);
}

void stream_session::abort() {
    sslog.info("[Stream #{}] Aborted stream session={}, peer={}, is_initialized={}", plan_id(), fmt::ptr(this), peer, is_initialized());
    close_session(stream_session_state::FAILED);
}

void stream_session::on_error(std::exception_ptr ep) {
    sslog.warn("[Stream #{}] Streaming error occurred, peer={}: {}", plan_id(), peer, ep);
    close_session(stream_session_state::FAILED);
}

void stream_session::complete() {
    if (_state != stream_session_state::STREAMING && _state != stream_session_state::CLOSING) {
        throw protocol_exception(format("[Stream #{}] Unexpected complete message from {} in state {}", plan_id(), peer, _state));
    }
    if (_peer_complete_received) {
        sslog.debug("[Stream #{}] Duplicate complete message from {}", plan_id(), peer);
        return;
    }
    _peer_complete_received = true;
    sslog.debug("[Stream #{}] Got complete message from {}, transfers={}", plan_id(), peer, _transfers.size());
    // The peer holds every file, queued retries are moot.
    std::erase_if(_send_queue, [] (const auto& x) { return x.second->type() == smt::FILE; });
    std::vector<table_id> cf_ids;
    for (auto& x : _transfers) {
        cf_ids.push_back(x.first);
    }
    for (auto& cf_id : cf_ids) {
        auto it = _transfers.find(cf_id);
        if (it != _transfers.end()) {
            it->second.complete_all();
        }
    }
    maybe_completed();
}

session_info stream_session::make_session_info() const {
    auto si = _session_info;
    si.state = _state;
    return si;
}

void stream_session::receive_task_completed(table_id cf_id) {
    _receivers.erase(cf_id);
    sslog.debug("[Stream #{}] receive  task_completed: cf_id={} done, stream_receive_task.size={} stream_transfer_task.size={}",
        plan_id(), cf_id, _receivers.size(), _transfers.size());
    maybe_completed();
}

void stream_session::transfer_task_completed(table_id cf_id) {
    _transfers.erase(cf_id);
    sslog.debug("[Stream #{}] transfer task_completed: cf_id={} done, stream_receive_task.size={} stream_transfer_task.size={}",
        plan_id(), cf_id, _receivers.size(), _transfers.size());
    maybe_completed();
}

// Tells the peer the session failed. Nothing is sent while a file is half
// written: the message cannot be framed there, so the peer learns of the
// failure from the file bytes stopping short and the connection closing,
// which its receive loop reports as an error of the session.
void stream_session::send_failed_complete_message() {
    if (!_socket || _file_in_flight) {
        sslog.debug("[Stream #{}] Not sending failed complete message to {}, connection unusable", plan_id(), peer);
        return;
    }
    sslog.debug("[Stream #{}] Sending failed complete message to {}", plan_id(), peer);
    send(std::make_unique<messages::session_failed_message>());
}

bool stream_session::maybe_completed() {
    if (_state != stream_session_state::STREAMING && _state != stream_session_state::CLOSING) {
        return false;
    }
    if (!_receivers.empty()) {
        return false;
    }
    if (!_complete_sent) {
        _complete_sent = true;
        set_state(stream_session_state::CLOSING);
        sslog.debug("[Stream #{}] All files from {} received, sending complete message", plan_id(), peer);
        send(std::make_unique<messages::complete_message>());
    }
    bool completed = _transfers.empty() && _peer_complete_received;
    if (completed) {
        sslog.debug("[Stream #{}] maybe_completed: {} -> COMPLETE: session={}, peer={}", plan_id(), _state, fmt::ptr(this), peer);
        close_session(stream_session_state::COMPLETE);
    }
    return completed;
}

void stream_session::close_session(stream_session_state final_state) {
    sslog.debug("[Stream #{}] close_session session={}, state={}, is_aborted={}", plan_id(), fmt::ptr(this), final_state, _is_aborted);
    if (_is_aborted) {
        return;
    }
    _is_aborted = true;
    set_state(final_state);
    _session_info.state = final_state;

    if (final_state == stream_session_state::FAILED) {
        for (auto& x : _transfers) {
            sslog.debug("[Stream #{}] close_session session={}, state={}, abort stream_transfer_task cf_id={}", plan_id(), fmt::ptr(this), final_state, x.first);
            x.second.abort();
        }
        for (auto& x : _receivers) {
            sslog.debug("[Stream #{}] close_session session={}, state={}, abort stream_receive_task cf_id={}", plan_id(), fmt::ptr(this), final_state, x.first);
            x.second.abort();
        }
        _send_queue.clear();
        if (!_received_failed_complete_message) {
            send_failed_complete_message();
        }
    }
    // Tasks point back to the session
    _transfers.clear();
    _receivers.clear();

    // The send loop drains what is queued and closes the connection
    _send_closed = true;
    _send_cv.signal();

    auto self = shared_from_this();
    if (auto sr = std::exchange(_stream_result, nullptr)) {
        sr->handle_session_complete(self);
    }
    _closed.set_value(final_state);
    sslog.debug("[Stream #{}] close_session session={}, state={}", plan_id(), fmt::ptr(this), final_state);
}

} // namespace streaming
