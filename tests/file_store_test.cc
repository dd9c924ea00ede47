/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>

#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/file.hh>
#include <seastar/util/tmp_file.hh>

#include "replica/file_store.hh"
#include "streaming/messages/file_message_header.hh"

using namespace streaming;
namespace fs = std::filesystem;

static void write_file(fs::path path, sstring data) {
    auto f = open_file_dma(path.native(), open_flags::wo | open_flags::create | open_flags::truncate).get();
    auto out = make_file_output_stream(std::move(f)).get();
    out.write(data).get();
    out.close().get();
}

static sstring read_file(fs::path path) {
    auto buf = util::read_entire_file_contiguous(path).get();
    return sstring(buf.data(), buf.size());
}

static sstring contents(size_t size) {
    sstring data(sstring::initialized_later(), size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = char('0' + i % 10);
    }
    return data;
}

static messages::file_message_header header_for(const table_info& t, sstring name, uint64_t size) {
    return messages::file_message_header(t.id, 0, t.keyspace, t.name, std::move(name), 1, {{0, size}});
}

SEASTAR_TEST_CASE(test_clip_ranges) {
    using replica::clip_ranges;
    // No ranges selects the whole file
    BOOST_REQUIRE(clip_ranges({}, 100) == byte_range_vector({{0, 100}}));
    BOOST_REQUIRE(clip_ranges({}, 0).empty());
    BOOST_REQUIRE(clip_ranges({{50, 200}}, 100) == byte_range_vector({{50, 100}}));
    BOOST_REQUIRE(clip_ranges({{100, 200}, {5, 5}}, 100).empty());
    BOOST_REQUIRE(clip_ranges({{30, 40}, {0, 10}, {5, 20}, {20, 25}}, 100) == byte_range_vector({{0, 25}, {30, 40}}));
    BOOST_REQUIRE(clip_ranges({{10, 5}}, 100).empty());
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_catalog_is_read_from_directories) {
    return tmp_dir::do_with_thread([] (tmp_dir& t) {
        auto dir = t.get_path();
        recursive_touch_directory((dir / "ks" / "b").native()).get();
        recursive_touch_directory((dir / "ks" / "a").native()).get();
        recursive_touch_directory((dir / "other" / "c").native()).get();
        // Hidden entries and plain files are not tables
        recursive_touch_directory((dir / "ks" / ".hidden").native()).get();
        write_file(dir / "ks" / "README", "not a table");

        replica::file_store store(dir.native());
        store.start().get();
        auto tables = store.tables("ks");
        BOOST_REQUIRE_EQUAL(tables.size(), 2);
        BOOST_REQUIRE_EQUAL(tables[0].name, "a");
        BOOST_REQUIRE_EQUAL(tables[1].name, "b");
        BOOST_REQUIRE(tables[0].id == make_table_id("ks", "a"));

        auto c = store.find_table("other", "c");
        BOOST_REQUIRE(c);
        BOOST_REQUIRE(store.has_table(c->id));
        BOOST_REQUIRE(!store.find_table("ks", "c"));
        BOOST_REQUIRE(!store.has_table(make_table_id("ks", ".hidden")));
        BOOST_REQUIRE(store.tables("none").empty());

        auto created = store.create_table("new", "t").get();
        BOOST_REQUIRE(store.has_table(created.id));
        BOOST_REQUIRE(file_exists(store.table_dir(created).native()).get());
        store.stop().get();
    });
}

SEASTAR_TEST_CASE(test_get_files) {
    return tmp_dir::do_with_thread([] (tmp_dir& t) {
        replica::file_store store(t.get_path().native());
        store.start().get();
        auto cf = store.create_table("ks", "cf").get();
        auto dir = store.table_dir(cf);
        write_file(dir / "b", contents(1000));
        write_file(dir / "a", contents(10));
        write_file(dir / ".a.tmp", contents(10));

        auto files = store.get_files(cf.id, {}).get();
        BOOST_REQUIRE_EQUAL(files.size(), 2);
        BOOST_REQUIRE_EQUAL(files[0]->name(), "a");
        BOOST_REQUIRE_EQUAL(files[1]->name(), "b");
        BOOST_REQUIRE(files[1]->sections() == byte_range_vector({{0, 1000}}));
        BOOST_REQUIRE_EQUAL(files[1]->estimated_keys(), 3);
        BOOST_REQUIRE_EQUAL(files[0]->estimated_keys(), 1);
        BOOST_REQUIRE_EQUAL(files[1]->table().name, "cf");

        auto buf = files[1]->read(995, 5).get();
        BOOST_REQUIRE_EQUAL(sstring(buf.get(), buf.size()), "56789");
        BOOST_REQUIRE_THROW(files[0]->read(5, 10).get(), std::exception);

        // "a" has nothing past byte 10
        files = store.get_files(cf.id, {{500, 600}}).get();
        BOOST_REQUIRE_EQUAL(files.size(), 1);
        BOOST_REQUIRE_EQUAL(files[0]->name(), "b");
        BOOST_REQUIRE(files[0]->sections() == byte_range_vector({{500, 600}}));

        BOOST_REQUIRE_THROW(store.get_files(make_table_id("ks", "missing"), {}).get(), std::runtime_error);
        store.stop().get();
    });
}

SEASTAR_TEST_CASE(test_unfinished_files_are_removed_on_start) {
    return tmp_dir::do_with_thread([] (tmp_dir& t) {
        auto dir = t.get_path() / "ks" / "cf";
        recursive_touch_directory(dir.native()).get();
        write_file(dir / "x", contents(100));
        write_file(dir / ".x.tmp", contents(40));
        write_file(dir / ".keep", "not ours");

        replica::file_store store(t.get_path().native());
        store.start().get();
        BOOST_REQUIRE(!file_exists((dir / ".x.tmp").native()).get());
        BOOST_REQUIRE(file_exists((dir / ".keep").native()).get());
        BOOST_REQUIRE(file_exists((dir / "x").native()).get());

        // Temporary files of a receive in progress are not streamed out
        write_file(dir / ".y.tmp", contents(10));
        auto files = store.get_files(make_table_id("ks", "cf"), {}).get();
        BOOST_REQUIRE_EQUAL(files.size(), 1);
        BOOST_REQUIRE_EQUAL(files[0]->name(), "x");
        store.stop().get();
    });
}

SEASTAR_TEST_CASE(test_writer_commit) {
    return tmp_dir::do_with_thread([] (tmp_dir& t) {
        replica::file_store store(t.get_path().native());
        store.start().get();
        auto cf = store.create_table("ks", "cf").get();
        auto data = contents(10000);

        auto writer = store.make_writer(header_for(cf, "f", data.size())).get();
        auto path = store.table_dir(cf) / "f";
        // Invisible until committed
        BOOST_REQUIRE(store.get_files(cf.id, {}).get().empty());
        writer->write(temporary_buffer<char>(data.data(), 4096)).get();
        writer->write(temporary_buffer<char>(data.data() + 4096, data.size() - 4096)).get();
        writer->commit().get();

        BOOST_REQUIRE(read_file(path) == data);
        BOOST_REQUIRE(!file_exists((store.table_dir(cf) / ".f.tmp").native()).get());
        auto files = store.get_files(cf.id, {}).get();
        BOOST_REQUIRE_EQUAL(files.size(), 1);
        BOOST_REQUIRE(files[0]->sections() == byte_range_vector({{0, 10000}}));
        store.stop().get();
    });
}

SEASTAR_TEST_CASE(test_writer_abort_and_short_file) {
    return tmp_dir::do_with_thread([] (tmp_dir& t) {
        replica::file_store store(t.get_path().native());
        store.start().get();
        auto cf = store.create_table("ks", "cf").get();
        auto tmp = store.table_dir(cf) / ".f.tmp";

        auto writer = store.make_writer(header_for(cf, "f", 100)).get();
        writer->write(temporary_buffer<char>("partial", 7)).get();
        writer->abort().get();
        BOOST_REQUIRE(!file_exists(tmp.native()).get());
        BOOST_REQUIRE(!file_exists((store.table_dir(cf) / "f").native()).get());

        writer = store.make_writer(header_for(cf, "f", 100)).get();
        writer->write(temporary_buffer<char>("partial", 7)).get();
        BOOST_REQUIRE_THROW(writer->commit().get(), std::runtime_error);
        BOOST_REQUIRE(!file_exists(tmp.native()).get());
        BOOST_REQUIRE(store.get_files(cf.id, {}).get().empty());

        writer = store.make_writer(header_for(cf, "f", 3)).get();
        BOOST_REQUIRE_THROW(writer->write(temporary_buffer<char>("toolong", 7)).get(), std::runtime_error);
        writer->abort().get();
        BOOST_REQUIRE(!file_exists(tmp.native()).get());
        store.stop().get();
    });
}

SEASTAR_TEST_CASE(test_writer_rejects_bad_names) {
    return tmp_dir::do_with_thread([] (tmp_dir& t) {
        replica::file_store store(t.get_path().native());
        store.start().get();
        auto cf = store.create_table("ks", "cf").get();
        for (auto name : {"", ".hidden", "../escape", "a/b"}) {
            BOOST_REQUIRE_THROW(store.make_writer(header_for(cf, name, 1)).get(), std::runtime_error);
        }
        table_info unknown{"ks", "unknown", make_table_id("ks", "unknown")};
        BOOST_REQUIRE_THROW(store.make_writer(header_for(unknown, "f", 1)).get(), std::runtime_error);
        store.stop().get();
    });
}
