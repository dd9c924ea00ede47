/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>

#include <seastar/testing/thread_test_case.hh>
#include <seastar/util/defer.hh>

#include "db/config.hh"
#include "streaming/stream_session.hh"
#include "streaming/stream_exception.hh"
#include "tests/memory_store.hh"

using namespace streaming;

namespace {

// A session that is never started, owning the tasks under test.
struct session_env {
    db::config cfg;
    tests::memory_store store;
    sharded<stream_manager> mgr;
    table_info cf;
    table_info other;
    shared_ptr<stream_session> session;

    session_env() {
        cf = store.add_table("ks", "cf");
        other = store.add_table("ks", "other");
        for (int i = 0; i < 3; ++i) {
            store.add_file("ks", "cf", format("f{}", i), sstring(100 * (i + 1), 'a' + i));
        }
        store.add_file("ks", "other", "o", "other data");
        mgr.start(std::ref(cfg), gms::inet_address("127.0.0.1"),
                std::ref<data_source>(store), std::ref<data_sink>(store)).get();
        session = make_shared<stream_session>(mgr.local(), gms::inet_address("127.0.0.2"));
    }

    ~session_env() {
        // Tasks point back to the session
        session->abort();
        session = nullptr;
        mgr.stop().get();
    }

    std::vector<stream_file_ptr> files(const table_info& t) {
        return store.get_files(t.id, {}).get();
    }
};

}

SEASTAR_THREAD_TEST_CASE(test_sequence_numbers_and_sizes) {
    session_env env;
    auto& task = env.session->get_or_create_transfer_task(env.cf.id);
    BOOST_REQUIRE(&task == &env.session->get_or_create_transfer_task(env.cf.id));

    auto files = env.files(env.cf);
    BOOST_REQUIRE_EQUAL(files.size(), 3);
    uint32_t expected_seq = 0;
    for (auto& f : files) {
        BOOST_REQUIRE_EQUAL(task.add_transfer_file(f, f->estimated_keys(), f->sections()), expected_seq++);
    }
    BOOST_REQUIRE_EQUAL(task.get_total_number_of_files(), 3);
    BOOST_REQUIRE_EQUAL(task.get_total_size(), 600);
    BOOST_REQUIRE_EQUAL(task.pending_files(), 3);

    auto msgs = task.get_file_messages();
    BOOST_REQUIRE_EQUAL(msgs.size(), 3);
    for (uint32_t i = 0; i < msgs.size(); ++i) {
        BOOST_REQUIRE_EQUAL(msgs[i].header.sequence_number, i);
        BOOST_REQUIRE_EQUAL(msgs[i].header.file_name, format("f{}", i));
        BOOST_REQUIRE_EQUAL(msgs[i].header.size, 100 * (i + 1));
        BOOST_REQUIRE(msgs[i].header.cf_id == env.cf.id);
    }

    auto summary = task.get_summary();
    BOOST_REQUIRE(summary.cf_id == env.cf.id);
    BOOST_REQUIRE_EQUAL(summary.files, 3);
    BOOST_REQUIRE_EQUAL(summary.total_size, 600);
}

SEASTAR_THREAD_TEST_CASE(test_sections_decide_the_size) {
    session_env env;
    auto& task = env.session->get_or_create_transfer_task(env.cf.id);
    auto files = env.files(env.cf);
    auto seq = task.add_transfer_file(files[2], 7, {{0, 10}, {50, 80}});
    auto msg = task.create_message_for_retry(seq);
    BOOST_REQUIRE_EQUAL(msg.header.size, 40);
    BOOST_REQUIRE_EQUAL(msg.header.estimated_keys, 7);
    BOOST_REQUIRE_EQUAL(task.get_total_size(), 40);
}

SEASTAR_THREAD_TEST_CASE(test_retry_and_completion) {
    session_env env;
    auto& task = env.session->get_or_create_transfer_task(env.cf.id);
    for (auto& f : env.files(env.cf)) {
        task.add_transfer_file(f, f->estimated_keys(), f->sections());
    }

    // A retry resends the same file under the same sequence number
    auto retry = task.create_message_for_retry(1);
    BOOST_REQUIRE_EQUAL(retry.header.sequence_number, 1);
    BOOST_REQUIRE_EQUAL(retry.header.file_name, "f1");
    BOOST_REQUIRE(retry.file == task.get_file_messages()[1].file);

    task.complete(1);
    BOOST_REQUIRE_EQUAL(task.pending_files(), 2);
    BOOST_REQUIRE_THROW(task.create_message_for_retry(1), no_such_file_exception);
    // Duplicate and unknown acks are ignored
    task.complete(1);
    task.complete(42);
    BOOST_REQUIRE_EQUAL(task.pending_files(), 2);

    // Sequence numbers are never reused
    auto f = env.files(env.cf)[0];
    BOOST_REQUIRE_EQUAL(task.add_transfer_file(f, 1, f->sections()), 3);

    task.complete(0);
    task.complete(2);
    BOOST_REQUIRE_EQUAL(env.session->transfers().size(), 1);
    task.complete(3);
    // The session dropped the finished task
    BOOST_REQUIRE(env.session->transfers().empty());
}

SEASTAR_THREAD_TEST_CASE(test_complete_all) {
    session_env env;
    auto& task = env.session->get_or_create_transfer_task(env.cf.id);
    for (auto& f : env.files(env.cf)) {
        task.add_transfer_file(f, f->estimated_keys(), f->sections());
    }
    auto& other = env.session->get_or_create_transfer_task(env.other.id);
    for (auto& f : env.files(env.other)) {
        other.add_transfer_file(f, f->estimated_keys(), f->sections());
    }
    BOOST_REQUIRE_EQUAL(env.session->transfers().size(), 2);
    task.complete_all();
    BOOST_REQUIRE_EQUAL(env.session->transfers().size(), 1);
    BOOST_REQUIRE(env.session->transfers().contains(env.other.id));
}

SEASTAR_THREAD_TEST_CASE(test_file_of_another_table_is_rejected) {
    session_env env;
    auto& task = env.session->get_or_create_transfer_task(env.cf.id);
    auto f = env.files(env.other)[0];
    BOOST_REQUIRE_THROW(task.add_transfer_file(f, 1, f->sections()), std::runtime_error);
    BOOST_REQUIRE_EQUAL(task.pending_files(), 0);
    BOOST_REQUIRE_EQUAL(task.get_total_size(), 0);
}

SEASTAR_THREAD_TEST_CASE(test_aborted_task_does_not_complete) {
    session_env env;
    auto& task = env.session->get_or_create_transfer_task(env.cf.id);
    for (auto& f : env.files(env.cf)) {
        task.add_transfer_file(f, f->estimated_keys(), f->sections());
    }
    task.abort();
    BOOST_REQUIRE_EQUAL(task.pending_files(), 0);
    BOOST_REQUIRE_THROW(task.create_message_for_retry(0), no_such_file_exception);
    task.complete(0);
    task.complete_all();
    BOOST_REQUIRE_EQUAL(env.session->transfers().size(), 1);
}

SEASTAR_THREAD_TEST_CASE(test_receive_task_counts_files_once) {
    session_env env;
    stream_receive_task task(env.session, env.cf.id, 2, 300);
    BOOST_REQUIRE_EQUAL(task.get_total_number_of_files(), 2);
    BOOST_REQUIRE_EQUAL(task.get_total_size(), 300);
    task.received(0);
    task.received(0);
    BOOST_REQUIRE_EQUAL(task.get_received_files(), 1);
    task.received(1);
    BOOST_REQUIRE_EQUAL(task.get_received_files(), 2);
    // Nothing counts once the task is done
    task.received(2);
    BOOST_REQUIRE_EQUAL(task.get_received_files(), 2);
}
