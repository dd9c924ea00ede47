/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "streaming/stream_state.hh"
#include <seastar/core/sstring.hh>
#include <exception>
#include <stdexcept>

namespace streaming {

// Terminal failure of a stream plan. Carries the final state of every
// session of the plan.
class stream_exception : public std::exception {
public:
    stream_state state;
    sstring msg;
    stream_exception(stream_state s, sstring m)
        : state(std::move(s))
        , msg(std::move(m)) {
    }
    virtual const char* what() const noexcept override {
        return msg.c_str();
    }
};

// The peer sent something that does not follow the wire protocol. Fatal to
// the connection it arrived on.
class protocol_exception : public std::runtime_error {
public:
    explicit protocol_exception(const sstring& msg)
        : std::runtime_error(msg) {
    }
};

// A retry named a file which is no longer pending, e.g. because the peer
// already acknowledged it.
class no_such_file_exception : public std::runtime_error {
public:
    explicit no_such_file_exception(const sstring& msg)
        : std::runtime_error(msg) {
    }
};

} // namespace streaming
