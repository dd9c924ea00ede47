/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>

#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/core/when_all.hh>

#include "streaming/stream_rate_limiter.hh"
#include "utils/updateable_value.hh"

using namespace streaming;
using namespace std::chrono_literals;
using clock_type = stream_rate_limiter::clock;

static const gms::inet_address peer1("127.0.0.1");
static const gms::inet_address peer2("127.0.0.2");

SEASTAR_TEST_CASE(test_zero_rate_never_waits) {
    auto now = clock_type::now();
    stream_rate_limiter limiter(0, now);
    for (int i = 0; i < 100; ++i) {
        BOOST_REQUIRE(limiter.reserve(1 << 30, now) == clock_type::duration::zero());
    }
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_reservations_queue_up) {
    auto now = clock_type::now();
    // 1000 bytes per second
    stream_rate_limiter limiter(1000, now);
    // Nothing is banked at creation, the first caller goes right away and
    // pushes the next free slot by one second.
    BOOST_REQUIRE(limiter.reserve(1000, now) == clock_type::duration::zero());
    auto wait = limiter.reserve(500, now);
    BOOST_REQUIRE(wait >= 999ms && wait <= 1001ms);
    wait = limiter.reserve(1, now);
    BOOST_REQUIRE(wait >= 1499ms && wait <= 1501ms);
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_rate_change_applies_to_next_reservation) {
    auto now = clock_type::now();
    stream_rate_limiter limiter(1000, now);
    limiter.reserve(1000, now);
    limiter.set_rate(0, now);
    BOOST_REQUIRE_EQUAL(limiter.rate(), 0);
    BOOST_REQUIRE(limiter.reserve(1 << 20, now) == clock_type::duration::zero());
    BOOST_REQUIRE_THROW(limiter.set_rate(-1, now), std::invalid_argument);
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_registry_creates_one_limiter_per_peer) {
    utils::updateable_value_source<uint32_t> mbits(8);
    stream_rate_limiter_registry registry(utils::updateable_value<uint32_t>(mbits), 1);
    auto a = registry.get_rate_limiter(peer1);
    auto b = registry.get_rate_limiter(peer1);
    auto c = registry.get_rate_limiter(peer2);
    BOOST_REQUIRE(a.get() == b.get());
    BOOST_REQUIRE(a.get() != c.get());
    BOOST_REQUIRE_EQUAL(registry.size(), 2);
    // 8 Mbit/s
    BOOST_REQUIRE_EQUAL(a->rate(), 1024 * 1024);
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_registry_follows_configuration) {
    utils::updateable_value_source<uint32_t> mbits(8);
    stream_rate_limiter_registry registry(utils::updateable_value<uint32_t>(mbits), 2);
    auto limiter = registry.get_rate_limiter(peer1);
    // Split between the shards
    BOOST_REQUIRE_EQUAL(limiter->rate(), 512 * 1024);

    mbits.set(16);
    auto again = registry.get_rate_limiter(peer1);
    BOOST_REQUIRE(again.get() == limiter.get());
    BOOST_REQUIRE_EQUAL(limiter->rate(), 1024 * 1024);

    mbits.set(0);
    registry.get_rate_limiter(peer1);
    BOOST_REQUIRE_EQUAL(limiter->rate(), 0);
    BOOST_REQUIRE_EQUAL(registry.size(), 1);
    return make_ready_future<>();
}

SEASTAR_THREAD_TEST_CASE(test_acquire_throttles) {
    // 1 Mbit/s on one shard is 131072 bytes/s
    utils::updateable_value_source<uint32_t> mbits(1);
    stream_rate_limiter_registry registry(utils::updateable_value<uint32_t>(mbits), 1);
    auto start = clock_type::now();
    // The first chunk is free, the rest of them add up to 0.25s
    when_all_succeed(
        registry.acquire(peer1, 32768),
        registry.acquire(peer1, 16384),
        registry.acquire(peer1, 16384)).discard_result().get();
    auto elapsed = clock_type::now() - start;
    BOOST_REQUIRE(elapsed >= 240ms);

    // Another peer has its own budget
    start = clock_type::now();
    registry.acquire(peer2, 32768).get();
    BOOST_REQUIRE(clock_type::now() - start < 200ms);

    mbits.set(0);
    start = clock_type::now();
    registry.acquire(peer1, 1 << 30).get();
    BOOST_REQUIRE(clock_type::now() - start < 200ms);
}
