/*
 * Copyright (C) 2018-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <memory>
#include <vector>

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include "schema/schema_fwd.hh"
#include "streaming/stream_fwd.hh"
#include "streaming/messages/file_message_header.hh"
#include "seastarx.hh"

namespace streaming {

// A local file that is to be sent. The contents are opaque to streaming.
class stream_file {
public:
    virtual ~stream_file() = default;
    virtual const table_info& table() const = 0;
    virtual const sstring& name() const = 0;
    virtual uint64_t estimated_keys() const = 0;
    // The parts of the file to send, in file order, non-overlapping.
    virtual const byte_range_vector& sections() const = 0;
    // Reads len bytes starting at pos. Throws if the file is shorter.
    virtual future<temporary_buffer<char>> read(uint64_t pos, size_t len) = 0;
};

using stream_file_ptr = seastar::shared_ptr<stream_file>;

// Stores one incoming file. Bytes are passed to write() in order; exactly
// one of commit() or abort() finishes the writer.
class incoming_file_writer {
public:
    virtual ~incoming_file_writer() = default;
    virtual future<> write(temporary_buffer<char> buf) = 0;
    // Makes the file visible. Fails if fewer bytes than announced arrived.
    virtual future<> commit() = 0;
    // Discards whatever was written so far.
    virtual future<> abort() = 0;
};

// Interface between storage and streaming, side that sends data. Also the
// catalog used to validate tables named by the peer.
class data_source {
public:
    virtual ~data_source() = default;
    virtual std::optional<table_info> find_table(std::string_view keyspace, std::string_view table) const = 0;
    virtual bool has_table(table_id id) const = 0;
    virtual std::vector<table_info> tables(std::string_view keyspace) const = 0;
    // Files of the table, each limited to the given byte ranges. Empty
    // ranges select whole files.
    virtual future<std::vector<stream_file_ptr>> get_files(table_id id, const byte_range_vector& ranges) = 0;
};

// Interface between storage and streaming, side that receives data
class data_sink {
public:
    virtual ~data_sink() = default;
    virtual future<std::unique_ptr<incoming_file_writer>> make_writer(const messages::file_message_header& header) = 0;
};

}
