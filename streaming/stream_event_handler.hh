/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "streaming/stream_event.hh"

namespace streaming {

// Listener of the events of a plan. Called synchronously from the session
// that caused the event.
class stream_event_handler {
public:
    virtual ~stream_event_handler() = default;
    virtual void handle_stream_event(session_prepared_event event) {}
    virtual void handle_stream_event(progress_event event) {}
    virtual void handle_stream_event(session_complete_event event) {}
};

} // namespace streaming
