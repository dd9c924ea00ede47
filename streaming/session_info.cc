/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "utils/assert.hh"
#include "streaming/session_info.hh"

namespace streaming {

void session_info::update_progress(progress_info new_progress) {
    BULKSTREAM_ASSERT(peer == new_progress.peer);
    auto& current_files = new_progress.dir == direction::IN ? receiving_files : sending_files;
    auto name = new_progress.file_name;
    current_files.insert_or_assign(std::move(name), std::move(new_progress));
}

uint64_t session_info::files_expected(direction dir) const {
    uint64_t total = 0;
    for (auto& s : summaries(dir)) {
        total += s.files;
    }
    return total;
}

uint64_t session_info::bytes_expected(direction dir) const {
    uint64_t total = 0;
    for (auto& s : summaries(dir)) {
        total += s.total_size;
    }
    return total;
}

uint64_t session_info::files_done(direction dir) const {
    uint64_t done = 0;
    for (auto& [name, p] : files(dir)) {
        if (p.is_completed()) {
            done++;
        }
    }
    return done;
}

uint64_t session_info::bytes_done(direction dir) const {
    uint64_t total = 0;
    for (auto& [name, p] : files(dir)) {
        total += p.current_bytes;
    }
    return total;
}

} // namespace streaming
