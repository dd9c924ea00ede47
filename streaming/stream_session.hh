/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/condition-variable.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/net/api.hh>
#include "streaming/stream_session_state.hh"
#include "streaming/stream_transfer_task.hh"
#include "streaming/stream_receive_task.hh"
#include "streaming/stream_request.hh"
#include "streaming/messages/prepare_message.hh"
#include "streaming/messages/file_message.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_reason.hh"
#include "streaming/session_info.hh"
#include <map>
#include <optional>
#include <vector>

namespace streaming {

class stream_result_future;

/**
 * Handles the streaming of one or more sections of one or more files to and from a specific
 * remote node.
 *
 * Both this node and the remote one will create a similar symmetrical stream_session. A streaming
 * session has the following life-cycle:
 *
 * 1. Connection Initialization
 *
 *   (a) A node (the initiator in the following) creates a new stream_session, initializes it (init())
 *       and then starts it (start()). Start opens a single connection to the remote node (the
 *       follower in the following), sends the protocol version byte and a stream_init_message.
 *   (b) Upon reception of that stream_init_message, the follower creates its own stream_session
 *       and binds it to the accepted connection (accept()). Both sessions are then PREPARING.
 *
 * 2. Streaming preparation phase
 *
 *   (a) The initiator sends a prepare_message that includes what files/sections this node will
 *       stream to the follower (stored in a stream_transfer_task, each table has its own transfer
 *       task) and what the follower needs to stream back (the stream requests).
 *   (b) Upon reception of the prepare_message, the follower records which files it will receive
 *       (stream_receive_task), looks up the files that were requested, and sends back its own
 *       prepare_message with a summary of the files that will be sent to the initiator (prepare()).
 *       After having sent that message, the follower goes to its Streaming phase.
 *   (c) When the initiator receives the follower prepare_message, it records which files it will
 *       receive and then goes to its own Streaming phase.
 *
 * 3. Streaming phase
 *
 *   (a) Each side sends a file_message for each file of each stream_transfer_task. A file_message
 *       consists of a header that indicates which file is coming, followed by the content of the
 *       file's sections. Sending is throttled by the rate limiter of the peer.
 *   (b) On the receiving side the file is written through the data sink and committed once fully
 *       received (stream_receive_task::received()). When all files of a stream_receive_task have
 *       been received the task is complete (receive_task_completed()).
 *   (c) If storing a file fails on the receiving end, the receiver retries the file (up to
 *       max_streaming_retries) by sending a retry_message to the sender. On receiving a
 *       retry_message, the sender simply queues the file_message for that file again.
 *
 * 4. Completion phase
 *
 *   (a) When a node has received every file it was promised it sends a complete_message and moves
 *       to CLOSING. The complete_message acknowledges every file the peer sent, so on receiving it
 *       the peer's transfer tasks are done (complete()).
 *   (b) A session is COMPLETE when it both sent and received a complete_message. It is FAILED on a
 *       connection or protocol error, or when the peer sent a session_failed_message.
 */
class stream_session : public enable_shared_from_this<stream_session> {
private:
    using inet_address = gms::inet_address;

    // Send queue order: higher priority first, then FIFO.
    struct send_order {
        int priority;
        uint64_t seq;
        bool operator<(const send_order& o) const noexcept {
            return priority != o.priority ? priority > o.priority : seq < o.seq;
        }
    };
public:
    /**
     * Streaming endpoint.
     *
     * Each {@code StreamSession} is identified by this InetAddress which is the listen address of the node streaming.
     */
    inet_address peer;
private:
    stream_manager& _mgr;
    // should not be null when session is started
    shared_ptr<stream_result_future> _stream_result;
    streaming::plan_id _plan_id;
    sstring _description;
    bool _initiator = true;

    // stream requests to send to the peer
    std::vector<stream_request> _requests;
    // local files to send, resolved into transfer tasks on start
    std::vector<stream_request> _transfer_requests;
    // streaming tasks are created and managed per table id
    std::map<table_id, stream_transfer_task> _transfers;
    // data receivers, filled after receiving prepare message
    std::map<table_id, stream_receive_task> _receivers;
    // failed receive attempts per file
    std::map<std::pair<table_id, uint32_t>, uint32_t> _retries;

    uint64_t _bytes_sent = 0;
    uint64_t _bytes_received = 0;

    bool _is_aborted = false;

    stream_session_state _state = stream_session_state::INITIALIZED;
    bool _complete_sent = false;
    bool _peer_complete_received = false;
    bool _received_failed_complete_message = false;

    session_info _session_info;

    stream_reason _reason = stream_reason::unspecified;
    shared_promise<stream_session_state> _closed;

    std::optional<connected_socket> _socket;
    input_stream<char> _in;
    output_stream<char> _out;
    messages::protocol_version _version = messages::current_version;
    std::map<send_order, messages::stream_message_ptr> _send_queue;
    uint64_t _send_seq = 0;
    condition_variable _send_cv;
    bool _send_closed = false;
    // A file's sections are partially written to the connection
    bool _file_in_flight = false;
public:
    stream_reason get_reason() const {
        return _reason;
    }
    void set_reason(stream_reason reason) {
        _reason = reason;
    }

    void add_bytes_sent(uint64_t bytes) {
        _bytes_sent += bytes;
    }

    void add_bytes_received(uint64_t bytes) {
        _bytes_received += bytes;
    }

    uint64_t get_bytes_sent() const {
        return _bytes_sent;
    }

    uint64_t get_bytes_received() const {
        return _bytes_received;
    }
public:
    /**
     * Create new streaming session with the peer.
     *
     * @param peer Address of streaming peer
     */
    stream_session(stream_manager& mgr, inet_address peer_);
    ~stream_session();

    streaming::plan_id plan_id() const;

    sstring description() const;

public:
    /**
     * Bind this session to report to specific {@link StreamResultFuture} and
     * perform pre-streaming initialization.
     *
     * @param streamResult result to report to
     */
    void init(shared_ptr<stream_result_future> stream_result_);

    // Connects to the peer and runs the session in the background.
    void start();

    // Runs the follower side of the session over an accepted connection
    // whose version byte and handshake were already consumed.
    future<> accept(connected_socket socket, input_stream<char> in, output_stream<char> out, messages::protocol_version version);

    bool is_initialized() const;

    /**
     * Request data fetch task to this session.
     *
     * @param keyspace Requesting keyspace
     * @param ranges Byte ranges to retrieve, empty for whole files
     * @param columnFamilies ColumnFamily names. Can be empty if requesting all CF under the keyspace.
     */
    void add_stream_request(sstring keyspace, byte_range_vector ranges, std::vector<sstring> column_families) {
        _requests.emplace_back(std::move(keyspace), std::move(ranges), std::move(column_families));
    }

    /**
     * Set up transfer for specific keyspace/ranges/CFs
     *
     * @param keyspace Transfer keyspace
     * @param ranges Byte ranges to send, empty for whole files
     * @param columnFamilies Transfer ColumnFamilies, all of the keyspace if empty
     */
    void add_transfer_ranges(sstring keyspace, byte_range_vector ranges, std::vector<sstring> column_families) {
        _transfer_requests.emplace_back(std::move(keyspace), std::move(ranges), std::move(column_families));
    }

    // Looks up the local files selected by the requests and creates the
    // transfer tasks for them. Unknown tables are an error.
    future<> add_transfer_files(std::vector<stream_request> requests);

    stream_transfer_task& get_or_create_transfer_task(table_id cf_id);

    const std::map<table_id, stream_transfer_task>& transfers() const noexcept {
        return _transfers;
    }

    const std::map<table_id, stream_receive_task>& receivers() const noexcept {
        return _receivers;
    }

    void close_session(stream_session_state final_state);

    // Resolves with COMPLETE or FAILED once the session is closed.
    future<stream_session_state> wait_closed() {
        return _closed.get_shared_future();
    }

public:
    /**
     * Set current state to {@code newState}.
     *
     * @param newState new state to set
     */
    void set_state(stream_session_state new_state) {
        _state = new_state;
    }

    /**
     * @return current state
     */
    stream_session_state get_state() const {
        return _state;
    }

    /**
     * Return if this session completed successfully.
     *
     * @return true if session completed successfully.
     */
    bool is_success() const {
        return _state == stream_session_state::COMPLETE;
    }

    /**
     * Call back for handling exception during streaming.
     */
    void on_error(std::exception_ptr ep);

    void abort();

    void received_failed_complete_message();

    /**
     * Prepare this session for sending/receiving files.
     */
    future<messages::prepare_message> prepare(std::vector<stream_request> requests, std::vector<stream_summary> summaries);

    /**
     * Handles the peer's complete message: every file sent so far arrived.
     */
    void complete();

    /**
     * @return Current snapshot of this session info.
     */
    session_info make_session_info() const;

    session_info& get_session_info() {
        return _session_info;
    }

    const session_info& get_session_info() const {
        return _session_info;
    }

    stream_manager& manager() noexcept { return _mgr; }
    const stream_manager& manager() const noexcept { return _mgr; }

    void receive_task_completed(table_id cf_id);
    void transfer_task_completed(table_id cf_id);
private:
    future<> initiate();
    future<> run_connection();
    future<> receive_loop();
    future<> send_loop();
    void send(messages::stream_message_ptr msg);
    future<> send_message(messages::stream_message& msg);
    future<> send_file(messages::file_message& msg);
    future<> handle_message(messages::stream_message_ptr msg);
    future<> receive_file(messages::file_message& msg);
    void receive_failed(const messages::file_message_header& header, std::exception_ptr ep);
    void handle_retry(table_id cf_id, uint32_t sequence_number);
    void handle_prepare_reply(messages::prepare_message msg);
    void update_progress(const messages::file_message_header& header, progress_info::direction dir, uint64_t current);
    void send_failed_complete_message();
    bool maybe_completed();
    void prepare_receiving(const stream_summary& summary);
    void start_streaming_files();
    void shutdown_connection() noexcept;
};

} // namespace streaming
