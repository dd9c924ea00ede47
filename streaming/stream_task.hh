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
#include "streaming/stream_summary.hh"
#include <seastar/core/shared_ptr.hh>

namespace streaming {

class stream_session;

/**
 * The files of one table that a session moves in one direction.
 *
 * The session owns its tasks and keeps them until the last file of the
 * task is done; the task calls back into the session then.
 */
class stream_task {
public:
    shared_ptr<stream_session> session;
    table_id cf_id;

    stream_task(shared_ptr<stream_session> session_, table_id cf_id_)
        : session(std::move(session_))
        , cf_id(cf_id_) {
    }
    stream_task(stream_task&&) = default;
    virtual ~stream_task() = default;

    virtual uint32_t get_total_number_of_files() const = 0;

    // Bytes of all sections of all files.
    virtual uint64_t get_total_size() const = 0;

    // No completion is reported after this.
    virtual void abort() = 0;

    // What the prepare phase announces for this task.
    stream_summary get_summary() const {
        return stream_summary(cf_id, get_total_number_of_files(), get_total_size());
    }
};

} // namespace streaming
