/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/smp.hh>

#include "replica/file_store.hh"
#include "utils/lister.hh"
#include "log.hh"

namespace replica {

static logging::logger fslog("file_store");

// Files carry no index, so the number of entries is guessed from the size.
static constexpr uint64_t estimated_bytes_per_key = 256;

streaming::byte_range_vector clip_ranges(const streaming::byte_range_vector& ranges, uint64_t file_size) {
    streaming::byte_range_vector ret;
    if (ranges.empty()) {
        if (file_size) {
            ret.emplace_back(0, file_size);
        }
        return ret;
    }
    for (auto [start, end] : ranges) {
        end = std::min(end, file_size);
        if (start < end) {
            ret.emplace_back(start, end);
        }
    }
    std::sort(ret.begin(), ret.end());
    streaming::byte_range_vector merged;
    for (auto& r : ret) {
        if (!merged.empty() && r.first <= merged.back().second) {
            merged.back().second = std::max(merged.back().second, r.second);
        } else {
            merged.push_back(r);
        }
    }
    return merged;
}

namespace {

class local_file final : public streaming::stream_file {
    table_info _table;
    sstring _name;
    std::filesystem::path _path;
    streaming::byte_range_vector _sections;
    uint64_t _estimated_keys;
public:
    local_file(table_info table, sstring name, std::filesystem::path path, streaming::byte_range_vector sections)
        : _table(std::move(table))
        , _name(std::move(name))
        , _path(std::move(path))
        , _sections(std::move(sections))
        , _estimated_keys(std::max<uint64_t>(streaming::messages::file_message_header::total_size(_sections) / estimated_bytes_per_key, 1)) {
    }

    const table_info& table() const override {
        return _table;
    }
    const sstring& name() const override {
        return _name;
    }
    uint64_t estimated_keys() const override {
        return _estimated_keys;
    }
    const streaming::byte_range_vector& sections() const override {
        return _sections;
    }
    future<temporary_buffer<char>> read(uint64_t pos, size_t len) override {
        auto f = co_await open_file_dma(_path.native(), open_flags::ro);
        std::exception_ptr ex;
        temporary_buffer<char> buf;
        try {
            buf = co_await f.dma_read_exactly<char>(pos, len);
        } catch (...) {
            ex = std::current_exception();
        }
        co_await f.close();
        if (ex) {
            std::rethrow_exception(ex);
        }
        co_return buf;
    }
};

class local_file_writer final : public streaming::incoming_file_writer {
    std::filesystem::path _tmp_path;
    std::filesystem::path _path;
    uint64_t _expected_size;
    uint64_t _written = 0;
    output_stream<char> _out;
    bool _closed = false;
public:
    local_file_writer(std::filesystem::path tmp_path, std::filesystem::path path, uint64_t expected_size, output_stream<char> out)
        : _tmp_path(std::move(tmp_path))
        , _path(std::move(path))
        , _expected_size(expected_size)
        , _out(std::move(out)) {
    }

    future<> write(temporary_buffer<char> buf) override {
        _written += buf.size();
        if (_written > _expected_size) {
            throw std::runtime_error(format("Received {} bytes for {}, expected {}", _written, _path.native(), _expected_size));
        }
        return _out.write(std::move(buf));
    }

    future<> commit() override {
        _closed = true;
        co_await _out.flush();
        co_await _out.close();
        if (_written != _expected_size) {
            co_await remove_file(_tmp_path.native());
            throw std::runtime_error(format("Received {} bytes for {}, expected {}", _written, _path.native(), _expected_size));
        }
        co_await rename_file(_tmp_path.native(), _path.native());
        co_await sync_directory(_path.parent_path().native());
        fslog.debug("Stored {} ({} bytes)", _path.native(), _written);
    }

    future<> abort() override {
        if (!_closed) {
            _closed = true;
            try {
                co_await _out.close();
            } catch (...) {
                fslog.debug("Failed to close {}: {}", _tmp_path.native(), std::current_exception());
            }
        }
        if (co_await file_exists(_tmp_path.native())) {
            co_await remove_file(_tmp_path.native());
        }
        fslog.debug("Discarded partially received {}", _path.native());
    }
};

bool is_temporary_file_name(std::string_view name) {
    return name.starts_with('.') && name.ends_with(".tmp");
}

// Received names must stay inside the table directory and must not
// collide with temporary files.
void validate_file_name(const sstring& name) {
    if (name.empty() || name[0] == '.' || name.find('/') != sstring::npos) {
        throw std::runtime_error(format("Invalid file name '{}'", name));
    }
}

} // anonymous namespace

file_store::file_store(sstring data_dir)
    : _data_dir(data_dir.c_str()) {
}

future<> file_store::start() {
    co_await recursive_touch_directory(_data_dir.native());
    co_await utils::lister::scan_dir(_data_dir, { directory_entry_type::directory }, [this] (fs::path dir, directory_entry ks) {
        return utils::lister::scan_dir(dir / ks.name.c_str(), { directory_entry_type::directory }, [this, ks = ks.name] (fs::path, directory_entry cf) {
            add_table(ks, cf.name);
            return make_ready_future<>();
        });
    });
    fslog.debug("Found {} tables under {}", _tables.size(), _data_dir.native());
    // The shards share the tree, one of them cleans it
    if (this_shard_id() == 0) {
        for (auto& [id, t] : _tables) {
            co_await remove_temporary_files(t);
        }
    }
}

// Left behind by receives that never finished.
future<> file_store::remove_temporary_files(const table_info& t) {
    auto dir = table_dir(t);
    std::vector<fs::path> stale;
    co_await utils::lister::scan_dir(dir, { directory_entry_type::regular }, [&stale] (fs::path dir, directory_entry de) {
        if (is_temporary_file_name(de.name)) {
            stale.push_back(dir / de.name.c_str());
        }
        return make_ready_future<>();
    }, utils::lister::show_hidden::yes);
    for (auto& path : stale) {
        fslog.info("Removing unfinished file {}", path.native());
        co_await remove_file(path.native());
    }
}

future<> file_store::stop() {
    return make_ready_future<>();
}

void file_store::add_table(sstring keyspace, sstring name) {
    auto id = make_table_id(keyspace, name);
    _tables.emplace(id, table_info{std::move(keyspace), std::move(name), id});
}

future<table_info> file_store::create_table(sstring keyspace, sstring name) {
    table_info t{keyspace, name, make_table_id(keyspace, name)};
    co_await recursive_touch_directory(table_dir(t).native());
    add_table(std::move(keyspace), std::move(name));
    co_return t;
}

std::filesystem::path file_store::table_dir(const table_info& t) const {
    return _data_dir / t.keyspace.c_str() / t.name.c_str();
}

const table_info& file_store::get_table(table_id id) const {
    auto it = _tables.find(id);
    if (it == _tables.end()) {
        throw std::runtime_error(format("Can't find a table with id {}", id));
    }
    return it->second;
}

std::optional<table_info> file_store::find_table(std::string_view keyspace, std::string_view table) const {
    auto it = _tables.find(make_table_id(keyspace, table));
    if (it == _tables.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool file_store::has_table(table_id id) const {
    return _tables.contains(id);
}

std::vector<table_info> file_store::tables(std::string_view keyspace) const {
    std::vector<table_info> ret;
    for (auto& [id, t] : _tables) {
        if (t.keyspace == keyspace) {
            ret.push_back(t);
        }
    }
    std::sort(ret.begin(), ret.end(), [] (const table_info& a, const table_info& b) {
        return a.name < b.name;
    });
    return ret;
}

future<std::vector<streaming::stream_file_ptr>> file_store::get_files(table_id id, const streaming::byte_range_vector& ranges) {
    auto t = get_table(id);
    auto dir = table_dir(t);
    std::vector<sstring> names;
    // Hidden files, temporary files of ongoing receives among them, are not listed
    co_await utils::lister::scan_dir(dir, { directory_entry_type::regular }, [&names] (fs::path, directory_entry de) {
        names.push_back(de.name);
        return make_ready_future<>();
    });
    std::sort(names.begin(), names.end());
    std::vector<streaming::stream_file_ptr> files;
    for (auto& name : names) {
        auto path = dir / name.c_str();
        auto size = co_await file_size(path.native());
        auto sections = clip_ranges(ranges, size);
        if (sections.empty()) {
            fslog.trace("Skipping {}: no data in the requested ranges", path.native());
            continue;
        }
        files.push_back(seastar::make_shared<local_file>(t, name, std::move(path), std::move(sections)));
    }
    co_return files;
}

future<std::unique_ptr<streaming::incoming_file_writer>> file_store::make_writer(const streaming::messages::file_message_header& header) {
    auto& t = get_table(header.cf_id);
    validate_file_name(header.file_name);
    auto dir = table_dir(t);
    co_await recursive_touch_directory(dir.native());
    auto path = dir / header.file_name.c_str();
    auto tmp_path = dir / format(".{}.tmp", header.file_name).c_str();
    auto f = co_await open_file_dma(tmp_path.native(), open_flags::wo | open_flags::create | open_flags::truncate);
    output_stream<char> out;
    std::exception_ptr ex;
    try {
        out = co_await make_file_output_stream(f);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        fslog.warn("Failed to open {} for writing: {}", tmp_path.native(), ex);
        co_await f.close();
        std::rethrow_exception(ex);
    }
    co_return std::make_unique<local_file_writer>(std::move(tmp_path), std::move(path), header.size, std::move(out));
}

} // namespace replica
