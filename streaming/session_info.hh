/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "gms/inet_address.hh"
#include "streaming/stream_summary.hh"
#include "streaming/stream_session_state.hh"
#include "streaming/progress_info.hh"
#include <vector>
#include <map>

namespace streaming {

/**
 * Snapshot of one stream session: what the two sides agreed to move in the
 * prepare phase, and how far every file got.
 */
class session_info {
public:
    using inet_address = gms::inet_address;
    using direction = progress_info::direction;

    inet_address peer;
    /** Tables the peer announced, one summary per table */
    std::vector<stream_summary> receiving_summaries;
    /** Tables this node announced */
    std::vector<stream_summary> sending_summaries;
    stream_session_state state = stream_session_state::INITIALIZED;

    // Latest progress per file, keyed by <keyspace>/<table>/<file>. A file
    // sent again after a retry starts over.
    std::map<sstring, progress_info> receiving_files;
    std::map<sstring, progress_info> sending_files;

    session_info() = default;
    session_info(inet_address peer_,
                 std::vector<stream_summary> receiving_summaries_,
                 std::vector<stream_summary> sending_summaries_,
                 stream_session_state state_)
        : peer(peer_)
        , receiving_summaries(std::move(receiving_summaries_))
        , sending_summaries(std::move(sending_summaries_))
        , state(state_) {
    }

    bool is_failed() const {
        return state == stream_session_state::FAILED;
    }

    /**
     * Update progress of receiving/sending file.
     *
     * @param newProgress new progress info
     */
    void update_progress(progress_info new_progress);

    // Announced in the prepare phase.
    uint64_t files_expected(direction dir) const;
    uint64_t bytes_expected(direction dir) const;

    // Moved so far. A file counts once all its bytes went through, whether
    // or not the receiver managed to store it.
    uint64_t files_done(direction dir) const;
    uint64_t bytes_done(direction dir) const;

private:
    const std::vector<stream_summary>& summaries(direction dir) const noexcept {
        return dir == direction::IN ? receiving_summaries : sending_summaries;
    }
    const std::map<sstring, progress_info>& files(direction dir) const noexcept {
        return dir == direction::IN ? receiving_files : sending_files;
    }
};

} // namespace streaming
