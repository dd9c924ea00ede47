/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "utils/UUID.hh"

namespace streaming {

class stream_event_handler;
class stream_manager;
class stream_result_future;
class stream_session;
class stream_state;
class stream_transfer_task;
class stream_receive_task;

using plan_id = utils::tagged_uuid<struct plan_id_tag>;

// What a plan does when one of its sessions fails.
enum class failure_policy {
    // Let the other sessions finish, then fail the plan.
    best_effort,
    // Abort the other sessions right away.
    fail_fast,
};

// Half-open [start, end) byte range of a file.
using byte_range = std::pair<uint64_t, uint64_t>;
using byte_range_vector = std::vector<byte_range>;

} // namespace streaming
