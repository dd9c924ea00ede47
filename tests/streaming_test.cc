/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>

#include <seastar/testing/thread_test_case.hh>
#include <seastar/core/sharded.hh>
#include <seastar/net/api.hh>

#include "db/config.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_plan.hh"
#include "streaming/stream_server.hh"
#include "streaming/stream_exception.hh"
#include "streaming/stream_event_handler.hh"
#include "streaming/messages/stream_message.hh"
#include "tests/memory_store.hh"
#include "tests/eventually.hh"

using namespace streaming;

static constexpr uint16_t test_port = 7192;
// Nothing listens there
static const gms::inet_address unreachable("127.0.0.9");

namespace {

using received_files = std::map<tests::memory_store::file_key, sstring>;

// One node of the test cluster, listening on its own loopback address.
struct node {
    gms::inet_address addr;
    db::config cfg;
    sharded<tests::memory_store> store;
    sharded<stream_manager> mgr;
    sharded<stream_server> server;

    explicit node(sstring address) : addr(address) {
        cfg.listen_address.set(address);
        cfg.streaming_port.set(test_port);
        store.start().get();
        mgr.start(std::ref(cfg), addr,
                sharded_parameter([this] { return std::ref<data_source>(store.local()); }),
                sharded_parameter([this] { return std::ref<data_sink>(store.local()); })).get();
        server.start(std::ref(mgr), addr.to_socket_address(test_port)).get();
        server.invoke_on_all(&stream_server::listen).get();
    }

    ~node() {
        server.stop().get();
        mgr.stop().get();
        store.stop().get();
    }

    void add_table(sstring ks, sstring cf) {
        store.invoke_on_all([ks, cf] (tests::memory_store& s) {
            s.add_table(ks, cf);
        }).get();
    }

    void add_file(sstring ks, sstring cf, sstring name, sstring data) {
        store.invoke_on_all([=] (tests::memory_store& s) {
            s.add_file(ks, cf, name, data);
        }).get();
    }

    received_files received() {
        return store.map_reduce0([] (tests::memory_store& s) { return s.received(); },
                received_files(),
                [] (received_files a, received_files b) {
                    a.merge(b);
                    return a;
                }).get();
    }

    unsigned count(unsigned (tests::memory_store::*what)() const) {
        return store.map_reduce0([what] (tests::memory_store& s) { return (s.*what)(); }, 0u, std::plus<unsigned>()).get();
    }

    std::vector<plan_id> plans() {
        return mgr.local().get_current_plans_on_all_shards().get();
    }

    uint64_t rejected_connections() {
        return server.map_reduce0([] (stream_server& s) { return s.rejected_connections(); }, uint64_t(0), std::plus<uint64_t>()).get();
    }
};

struct event_counter : public stream_event_handler {
    unsigned prepared = 0;
    unsigned succeeded = 0;
    unsigned failed = 0;
    unsigned progress = 0;
    uint64_t files_to_send = 0;

    void handle_stream_event(session_prepared_event event) override {
        prepared++;
        files_to_send += event.session.files_expected(progress_info::direction::OUT);
    }
    void handle_stream_event(session_complete_event event) override {
        (event.success ? succeeded : failed)++;
    }
    void handle_stream_event(progress_event event) override {
        progress++;
    }
};

sstring make_data(size_t size, char seed) {
    sstring data(sstring::initialized_later(), size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = char(seed + i % 31);
    }
    return data;
}

// Both nodes know the table, only the first one has files in it.
void populate(node& from, node& to) {
    for (auto* n : {&from, &to}) {
        n->add_table("ks", "cf");
        n->add_table("ks", "other");
    }
    from.add_file("ks", "cf", "big", make_data(300 * 1024, 'a'));
    from.add_file("ks", "cf", "small", make_data(100, 'b'));
    from.add_file("ks", "other", "one", make_data(5000, 'c'));
}

stream_state expect_failure(future<stream_state> f) {
    try {
        f.get();
    } catch (const stream_exception& e) {
        return e.state;
    }
    throw std::runtime_error("Stream plan was expected to fail");
}

}

SEASTAR_THREAD_TEST_CASE(test_transfer_files) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);
    event_counter events;

    stream_plan plan(a.mgr.local(), "transfer", stream_reason::rebalance);
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"}).listeners({&events});
    auto state = plan.execute().get();
    BOOST_REQUIRE(state.plan_id == plan.id());
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 1);
    BOOST_REQUIRE(state.sessions[0].state == stream_session_state::COMPLETE);
    BOOST_REQUIRE_EQUAL(state.sessions[0].files_done(progress_info::direction::OUT), 2);
    BOOST_REQUIRE_EQUAL(state.sessions[0].sending_files.count("ks/cf/small"), 1);

    auto got = b.received();
    BOOST_REQUIRE_EQUAL(got.size(), 2);
    BOOST_REQUIRE(got.at({"ks", "cf", "big"}) == make_data(300 * 1024, 'a'));
    BOOST_REQUIRE(got.at({"ks", "cf", "small"}) == make_data(100, 'b'));
    BOOST_REQUIRE(a.received().empty());

    BOOST_REQUIRE_EQUAL(events.prepared, 1);
    BOOST_REQUIRE_EQUAL(events.files_to_send, 2);
    BOOST_REQUIRE_EQUAL(events.succeeded, 1);
    BOOST_REQUIRE_EQUAL(events.failed, 0);
    BOOST_REQUIRE_GT(events.progress, 0);

    eventually([&] {
        BOOST_REQUIRE(a.plans().empty());
        BOOST_REQUIRE(b.plans().empty());
    });
}

SEASTAR_THREAD_TEST_CASE(test_request_byte_ranges) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(b, a);

    stream_plan plan(a.mgr.local(), "request");
    // Out of order and overlapping ranges are merged, the rest is clipped
    plan.request_ranges(b.addr, "ks", {{4000, 6000}, {10, 20}, {15, 30}});
    auto state = plan.execute().get();
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 1);
    BOOST_REQUIRE(!state.has_failed_session());

    auto big = make_data(300 * 1024, 'a');
    auto one = make_data(5000, 'c');
    auto got = a.received();
    BOOST_REQUIRE_EQUAL(got.size(), 3);
    BOOST_REQUIRE(got.at({"ks", "cf", "big"}) == big.substr(10, 20) + big.substr(4000, 2000));
    // Only [10, 30) is within the small file
    BOOST_REQUIRE(got.at({"ks", "cf", "small"}) == make_data(100, 'b').substr(10, 20));
    BOOST_REQUIRE(got.at({"ks", "other", "one"}) == one.substr(10, 20) + one.substr(4000, 1000));
    BOOST_REQUIRE(b.received().empty());
}

SEASTAR_THREAD_TEST_CASE(test_both_directions_in_one_session) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);
    b.add_file("ks", "other", "from_b", make_data(1000, 'x'));

    stream_plan plan(a.mgr.local(), "both");
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"});
    plan.request_ranges(b.addr, "ks", {}, {"other"});
    auto state = plan.execute().get();
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 1);
    BOOST_REQUIRE(state.sessions[0].state == stream_session_state::COMPLETE);
    auto& si = state.sessions[0];
    BOOST_REQUIRE_EQUAL(si.files_expected(progress_info::direction::OUT), 2);
    BOOST_REQUIRE_EQUAL(si.files_expected(progress_info::direction::IN), 1);
    BOOST_REQUIRE_EQUAL(si.bytes_expected(progress_info::direction::IN), 1000);
    BOOST_REQUIRE_EQUAL(si.files_done(progress_info::direction::IN), 1);
    BOOST_REQUIRE_EQUAL(si.bytes_done(progress_info::direction::OUT), 300 * 1024 + 100);

    BOOST_REQUIRE_EQUAL(b.received().size(), 2);
    auto got = a.received();
    BOOST_REQUIRE_EQUAL(got.size(), 1);
    BOOST_REQUIRE(got.at({"ks", "other", "from_b"}) == make_data(1000, 'x'));
}

SEASTAR_THREAD_TEST_CASE(test_failed_store_is_retried) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);
    // Succeeds on the last attempt allowed
    b.store.invoke_on_all([] (tests::memory_store& s) {
        s.fail_commits("small", 3);
    }).get();

    stream_plan plan(a.mgr.local(), "retry");
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"});
    auto state = plan.execute().get();
    BOOST_REQUIRE(!state.has_failed_session());

    BOOST_REQUIRE_EQUAL(b.count(&tests::memory_store::failed_commits), 3);
    BOOST_REQUIRE_EQUAL(b.count(&tests::memory_store::aborts), 3);
    auto got = b.received();
    BOOST_REQUIRE_EQUAL(got.size(), 2);
    BOOST_REQUIRE(got.at({"ks", "cf", "small"}) == make_data(100, 'b'));
}

SEASTAR_THREAD_TEST_CASE(test_retries_run_out) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);
    b.cfg.max_streaming_retries.set(1);
    b.store.invoke_on_all([] (tests::memory_store& s) {
        s.fail_commits("small", 2);
    }).get();

    stream_plan plan(a.mgr.local(), "retry");
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"});
    auto state = expect_failure(plan.execute());
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 1);
    BOOST_REQUIRE(state.sessions[0].is_failed());
    BOOST_REQUIRE_EQUAL(b.count(&tests::memory_store::failed_commits), 2);
    BOOST_REQUIRE(!b.received().contains({"ks", "cf", "small"}));

    eventually([&] {
        BOOST_REQUIRE(a.plans().empty());
        BOOST_REQUIRE(b.plans().empty());
    });
}

SEASTAR_THREAD_TEST_CASE(test_request_of_unknown_table_fails) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(b, a);

    stream_plan plan(a.mgr.local(), "unknown");
    plan.request_ranges(b.addr, "ks", {}, {"cf", "missing"});
    auto state = expect_failure(plan.execute());
    BOOST_REQUIRE(state.sessions[0].is_failed());
    BOOST_REQUIRE(a.received().empty());
    eventually([&] {
        BOOST_REQUIRE(b.plans().empty());
    });
}

SEASTAR_THREAD_TEST_CASE(test_transfer_of_unknown_table_fails) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);

    stream_plan plan(a.mgr.local(), "unknown");
    plan.transfer_ranges(b.addr, "ks", {}, {"missing"});
    auto state = expect_failure(plan.execute());
    BOOST_REQUIRE(state.sessions[0].is_failed());
    // Nothing reached the peer
    BOOST_REQUIRE(b.plans().empty());
    BOOST_REQUIRE_EQUAL(b.server.local().total_connections(), 0);
}

SEASTAR_THREAD_TEST_CASE(test_nothing_to_stream) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    a.add_table("ks", "cf");

    stream_plan plan(a.mgr.local(), "nothing");
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"});
    auto state = plan.execute().get();
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 1);
    BOOST_REQUIRE(state.sessions[0].state == stream_session_state::COMPLETE);
    BOOST_REQUIRE(b.plans().empty());
}

SEASTAR_THREAD_TEST_CASE(test_abort_in_the_middle_of_a_file) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);
    a.store.invoke_on_all(&tests::memory_store::hold_reads).get();

    stream_plan plan(a.mgr.local(), "abort");
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"});
    auto f = plan.execute();
    eventually([&] {
        BOOST_REQUIRE_GT(a.count(&tests::memory_store::reads), 0);
    });
    BOOST_REQUIRE_EQUAL(a.plans().size(), 1);

    plan.abort();
    a.store.invoke_on_all(&tests::memory_store::release_reads).get();
    auto state = expect_failure(std::move(f));
    BOOST_REQUIRE(state.sessions[0].is_failed());

    // The peer saw the connection end in the middle of the file
    eventually([&] {
        BOOST_REQUIRE(b.plans().empty());
        BOOST_REQUIRE_EQUAL(b.count(&tests::memory_store::aborts), 1);
    });
    BOOST_REQUIRE(b.received().empty());
}

SEASTAR_THREAD_TEST_CASE(test_best_effort_keeps_healthy_sessions) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(b, a);

    stream_plan plan(a.mgr.local(), "best effort", stream_reason::repair, failure_policy::best_effort);
    plan.request_ranges(b.addr, "ks", {}, {"cf"});
    plan.request_ranges(unreachable, "ks", {}, {"cf"});
    auto state = expect_failure(plan.execute());
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 2);
    for (auto& si : state.sessions) {
        BOOST_REQUIRE(si.state == (si.peer == b.addr ? stream_session_state::COMPLETE : stream_session_state::FAILED));
    }
    BOOST_REQUIRE(state.failed_peers() == std::vector<gms::inet_address>{unreachable});
    BOOST_REQUIRE_EQUAL(a.received().size(), 2);
}

SEASTAR_THREAD_TEST_CASE(test_fail_fast_aborts_other_sessions) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(b, a);
    // Keeps the healthy session busy until the other one failed
    b.store.invoke_on_all(&tests::memory_store::hold_reads).get();

    stream_plan plan(a.mgr.local(), "fail fast", stream_reason::repair, failure_policy::fail_fast);
    plan.request_ranges(b.addr, "ks", {}, {"cf"});
    plan.request_ranges(unreachable, "ks", {}, {"cf"});
    auto f = plan.execute();
    auto state = expect_failure(std::move(f));
    b.store.invoke_on_all(&tests::memory_store::release_reads).get();
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 2);
    for (auto& si : state.sessions) {
        BOOST_REQUIRE(si.is_failed());
    }
    eventually([&] {
        BOOST_REQUIRE(b.plans().empty());
    });
    BOOST_REQUIRE(a.received().size() < 2);
}

SEASTAR_THREAD_TEST_CASE(test_peer_failure_is_reported) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);
    a.store.invoke_on_all(&tests::memory_store::hold_reads).get();

    stream_plan plan(a.mgr.local(), "peer failure");
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"});
    auto f = plan.execute();
    eventually([&] {
        BOOST_REQUIRE_EQUAL(b.plans().size(), 1);
    });
    // The receiving side gives up on the sender
    b.mgr.local().fail_sessions_on_all_shards(a.addr).get();
    a.store.invoke_on_all(&tests::memory_store::release_reads).get();
    auto state = expect_failure(std::move(f));
    BOOST_REQUIRE(state.sessions[0].is_failed());
}

SEASTAR_THREAD_TEST_CASE(test_unsupported_version_is_rejected) {
    node b("127.0.0.2");

    auto s = seastar::connect(b.addr.to_socket_address(test_port)).get();
    auto out = s.output();
    auto in = s.input();
    char bad_version = char(messages::current_version + 1);
    out.write(&bad_version, 1).get();
    out.write("garbage").get();
    out.flush().get();
    // The node hangs up without answering
    auto buf = in.read().get();
    BOOST_REQUIRE(buf.empty());
    out.close().get();
    in.close().get();

    eventually([&] {
        BOOST_REQUIRE_EQUAL(b.rejected_connections(), 1);
    });
    BOOST_REQUIRE(b.plans().empty());
}

SEASTAR_THREAD_TEST_CASE(test_connection_lost_after_handshake) {
    node b("127.0.0.2");
    b.add_table("ks", "cf");

    messages::stream_init_message init{gms::inet_address("127.0.0.1"), plan_id::create_random_id(), "handshake only", stream_reason::repair};
    auto s = seastar::connect(b.addr.to_socket_address(test_port)).get();
    auto out = s.output();
    auto in = s.input();
    messages::write_handshake(out, init).get();
    out.flush().get();
    eventually([&] {
        auto plans = b.plans();
        BOOST_REQUIRE_EQUAL(plans.size(), 1);
        BOOST_REQUIRE(plans[0] == init.plan_id);
    });

    // Hanging up before the prepare message fails the plan
    out.close().get();
    in.close().get();
    eventually([&] {
        BOOST_REQUIRE(b.plans().empty());
    });
    BOOST_REQUIRE_EQUAL(b.rejected_connections(), 0);
}

SEASTAR_THREAD_TEST_CASE(test_duplicate_handshake_is_refused) {
    node b("127.0.0.2");
    b.add_table("ks", "cf");

    messages::stream_init_message init{gms::inet_address("127.0.0.1"), plan_id::create_random_id(), "duplicated", stream_reason::repair};
    auto first = seastar::connect(b.addr.to_socket_address(test_port)).get();
    auto first_out = first.output();
    auto first_in = first.input();
    messages::write_handshake(first_out, init).get();
    first_out.flush().get();
    eventually([&] {
        BOOST_REQUIRE_EQUAL(b.plans().size(), 1);
    });

    // The same plan again on a second connection
    auto second = seastar::connect(b.addr.to_socket_address(test_port)).get();
    auto second_out = second.output();
    auto second_in = second.input();
    messages::write_handshake(second_out, init).get();
    second_out.flush().get();
    auto buf = second_in.read().get();
    BOOST_REQUIRE(buf.empty());
    second_out.close().get();
    second_in.close().get();

    eventually([&] {
        BOOST_REQUIRE_EQUAL(b.rejected_connections(), 1);
    });
    // The first connection still owns the plan
    auto plans = b.plans();
    BOOST_REQUIRE_EQUAL(plans.size(), 1);
    BOOST_REQUIRE(plans[0] == init.plan_id);

    first_out.close().get();
    first_in.close().get();
    eventually([&] {
        BOOST_REQUIRE(b.plans().empty());
    });
}

SEASTAR_THREAD_TEST_CASE(test_unknown_message_type_fails_only_its_plan) {
    node a("127.0.0.1");
    node b("127.0.0.2");
    populate(a, b);
    // Keeps the healthy plan running while the broken one fails
    a.store.invoke_on_all(&tests::memory_store::hold_reads).get();

    stream_plan plan(a.mgr.local(), "healthy");
    plan.transfer_ranges(b.addr, "ks", {}, {"cf"});
    auto f = plan.execute();
    eventually([&] {
        BOOST_REQUIRE_EQUAL(b.plans().size(), 1);
    });
    auto healthy = b.plans()[0];

    messages::stream_init_message init{gms::inet_address("127.0.0.3"), plan_id::create_random_id(), "broken", stream_reason::repair};
    auto s = seastar::connect(b.addr.to_socket_address(test_port)).get();
    auto out = s.output();
    auto in = s.input();
    messages::write_handshake(out, init).get();
    out.flush().get();
    eventually([&] {
        BOOST_REQUIRE_EQUAL(b.plans().size(), 2);
    });

    // Message type 99 with an empty payload
    const char envelope[] = {char(99), 0, 0, 0, 0};
    out.write(envelope, sizeof(envelope)).get();
    out.flush().get();
    // Whatever the node answers, it hangs up afterwards
    while (!in.read().get().empty()) {
    }
    out.close().get();
    in.close().get();

    eventually([&] {
        auto plans = b.plans();
        BOOST_REQUIRE_EQUAL(plans.size(), 1);
        BOOST_REQUIRE(plans[0] == healthy);
    });

    a.store.invoke_on_all(&tests::memory_store::release_reads).get();
    auto state = f.get();
    BOOST_REQUIRE_EQUAL(state.sessions.size(), 1);
    BOOST_REQUIRE(state.sessions[0].state == stream_session_state::COMPLETE);
    BOOST_REQUIRE_EQUAL(b.received().size(), 2);
    eventually([&] {
        BOOST_REQUIRE(b.plans().empty());
    });
}
