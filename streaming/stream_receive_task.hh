/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <unordered_set>

#include "streaming/stream_fwd.hh"
#include "streaming/stream_task.hh"

namespace streaming {

/**
 * Task that manages receiving files for the session for certain ColumnFamily.
 */
class stream_receive_task : public stream_task {
private:
    // number of files to receive
    uint32_t _total_files;
    // total size of files to receive
    uint64_t _total_size;
    std::unordered_set<uint32_t> _received;
    bool _done = false;
public:
    stream_receive_task(stream_receive_task&&) = default;
    stream_receive_task(shared_ptr<stream_session> _session, table_id _cf_id, uint32_t _total_files, uint64_t _total_size);
    ~stream_receive_task();

    virtual uint32_t get_total_number_of_files() const override {
        return _total_files;
    }

    virtual uint64_t get_total_size() const override {
        return _total_size;
    }

    uint32_t get_received_files() const noexcept {
        return _received.size();
    }

    /**
     * Process received file.
     *
     * Counts the file once even if it arrives again. When the last file
     * arrived the session is told and the task may be destroyed.
     */
    void received(uint32_t sequence_number);

    /**
     * Abort this task.
     * Files being written are discarded by the session that owns their
     * writers, so nothing is announced as completed after this.
     */
    virtual void abort() override {
        _done = true;
    }
};

} // namespace streaming
