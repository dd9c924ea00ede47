/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "log.hh"
#include "streaming/stream_receive_task.hh"
#include "streaming/stream_session.hh"

namespace streaming {

extern logging::logger sslog;

stream_receive_task::stream_receive_task(shared_ptr<stream_session> _session, table_id _cf_id, uint32_t total_files, uint64_t total_size)
        : stream_task(std::move(_session), std::move(_cf_id))
        , _total_files(total_files)
        , _total_size(total_size) {
}

stream_receive_task::~stream_receive_task() {
}

void stream_receive_task::received(uint32_t sequence_number) {
    if (_done) {
        return;
    }
    if (!_received.insert(sequence_number).second) {
        sslog.debug("[Stream #{}] File seq={} of cf_id={} received again", session->plan_id(), sequence_number, cf_id);
        return;
    }
    if (_received.size() >= _total_files) {
        _done = true;
        auto s = session;
        s->receive_task_completed(cf_id);
    }
}

} // namespace streaming
