/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/util/log.hh>

#include "log.hh"
#include "streaming/stream_transfer_task.hh"
#include "streaming/stream_session.hh"
#include "streaming/stream_exception.hh"

namespace streaming {

extern logging::logger sslog;

stream_transfer_task::stream_transfer_task(shared_ptr<stream_session> session, table_id cf_id)
    : stream_task(std::move(session), cf_id) {
}

stream_transfer_task::~stream_transfer_task() = default;

uint32_t stream_transfer_task::add_transfer_file(stream_file_ptr file, uint64_t estimated_keys, byte_range_vector sections) {
    auto& table = file->table();
    if (table.id != cf_id) {
        on_internal_error(sslog, format("[Stream #{}] File {} of table {} added to the transfer task of cf_id={}",
                session->plan_id(), file->name(), table, cf_id));
    }
    auto seq = _sequence_number++;
    messages::file_message_header header(cf_id, seq, table.keyspace, table.name, file->name(), estimated_keys, std::move(sections));
    _total_size += header.size;
    _total_files++;
    _files.emplace(seq, messages::file_message(std::move(header), std::move(file)));
    return seq;
}

std::vector<messages::file_message> stream_transfer_task::get_file_messages() const {
    std::vector<messages::file_message> ret;
    ret.reserve(_files.size());
    for (auto& x : _files) {
        ret.push_back(x.second);
    }
    return ret;
}

void stream_transfer_task::complete(uint32_t sequence_number) {
    if (!_files.erase(sequence_number)) {
        sslog.debug("[Stream #{}] Ignoring ack of unknown file seq={} of cf_id={}", session->plan_id(), sequence_number, cf_id);
        return;
    }
    if (_files.empty() && !_aborted) {
        // May destroy this task, keep the session alive for the call.
        auto s = session;
        s->transfer_task_completed(cf_id);
    }
}

void stream_transfer_task::complete_all() {
    if (_files.empty() || _aborted) {
        return;
    }
    _files.clear();
    auto s = session;
    s->transfer_task_completed(cf_id);
}

messages::file_message stream_transfer_task::create_message_for_retry(uint32_t sequence_number) const {
    auto it = _files.find(sequence_number);
    if (it == _files.end()) {
        throw no_such_file_exception(format("No pending file with seq={} in the transfer task of cf_id={}", sequence_number, cf_id));
    }
    return it->second;
}

void stream_transfer_task::abort() {
    _aborted = true;
    _files.clear();
}

} // namespace streaming
