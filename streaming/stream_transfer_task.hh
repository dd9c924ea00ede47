/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <map>
#include <vector>

#include "streaming/stream_fwd.hh"
#include "streaming/stream_task.hh"
#include "streaming/messages/file_message.hh"

namespace streaming {

/**
 * StreamTransferTask sends sections of files in certain ColumnFamily.
 *
 * Every file gets the next sequence number of the task. The file stays
 * pending until the peer acknowledged it, so a retry can send it again.
 */
class stream_transfer_task : public stream_task {
private:
    uint32_t _sequence_number = 0;
    std::map<uint32_t, messages::file_message> _files;
    uint64_t _total_size = 0;
    uint32_t _total_files = 0;
    bool _aborted = false;
public:
    stream_transfer_task(stream_transfer_task&&) = default;
    stream_transfer_task(shared_ptr<stream_session> session, table_id cf_id);
    ~stream_transfer_task();
public:
    virtual void abort() override;

    virtual uint32_t get_total_number_of_files() const override {
        return _total_files;
    }

    virtual uint64_t get_total_size() const override {
        return _total_size;
    }

    // Queues the given sections of file for sending and returns the
    // sequence number assigned to it.
    uint32_t add_transfer_file(stream_file_ptr file, uint64_t estimated_keys, byte_range_vector sections);

    // Messages of the files not acknowledged yet, in sequence order.
    std::vector<messages::file_message> get_file_messages() const;

    size_t pending_files() const noexcept {
        return _files.size();
    }

    /**
     * Received ACK for file at {@code sequenceNumber}.
     *
     * The session is told once the last pending file is gone. The task may
     * be destroyed by then, so nothing may touch it after this returns.
     */
    void complete(uint32_t sequence_number);

    // The peer acknowledged every file of the task at once.
    void complete_all();

    // Throws no_such_file_exception if the file is no longer pending.
    messages::file_message create_message_for_retry(uint32_t sequence_number) const;
};

} // namespace streaming
