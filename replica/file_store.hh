/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "streaming/streaming_database_interface.hh"
#include "seastarx.hh"

namespace replica {

// Storage for streamed files, laid out as <data_dir>/<keyspace>/<table>/<file>.
//
// The catalog of tables is read from the directory tree by start(). Table
// ids are derived from the qualified table name, so two nodes agree on the
// id of a table without exchanging catalogs. Incoming files are written
// under a hidden temporary name and only renamed into place on commit, so
// a half received file is never listed.
//
// One instance per shard; all instances share the directory tree.
class file_store final : public streaming::data_source, public streaming::data_sink {
    std::filesystem::path _data_dir;
    std::map<table_id, table_info> _tables;
public:
    explicit file_store(sstring data_dir);

    future<> start();
    future<> stop();

    // Creates the directory of the table if needed and adds it to the
    // catalog of this shard.
    future<table_info> create_table(sstring keyspace, sstring name);

    std::filesystem::path table_dir(const table_info& t) const;

    std::optional<table_info> find_table(std::string_view keyspace, std::string_view table) const override;
    bool has_table(table_id id) const override;
    std::vector<table_info> tables(std::string_view keyspace) const override;
    future<std::vector<streaming::stream_file_ptr>> get_files(table_id id, const streaming::byte_range_vector& ranges) override;

    future<std::unique_ptr<streaming::incoming_file_writer>> make_writer(const streaming::messages::file_message_header& header) override;
private:
    const table_info& get_table(table_id id) const;
    void add_table(sstring keyspace, sstring name);
    future<> remove_temporary_files(const table_info& t);
};

// Intersects the requested ranges with [0, file_size). Empty ranges select
// the whole file. The result is sorted, merged and free of empty ranges.
streaming::byte_range_vector clip_ranges(const streaming::byte_range_vector& ranges, uint64_t file_size);

} // namespace replica
