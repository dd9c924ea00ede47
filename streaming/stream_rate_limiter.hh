/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <unordered_map>

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/smp.hh>
#include <seastar/core/timer.hh>

#include "gms/inet_address.hh"
#include "utils/updateable_value.hh"
#include "seastarx.hh"

namespace streaming {

/**
 * Smooth token bucket over bytes.
 *
 * Each acquisition reserves the next free slot on a timeline advancing at
 * rate bytes per second, and the caller waits until its slot starts. A large
 * acquisition is therefore paid for by whoever comes next. Idle time is
 * banked as stored bytes, up to one second worth of them, and spent first.
 *
 * A rate of zero means unlimited.
 */
class stream_rate_limiter {
public:
    using clock = seastar::steady_clock_type;
    static constexpr double max_burst_seconds = 1.0;
private:
    double _rate = 0;
    double _stored = 0;
    double _max_stored = 0;
    clock::time_point _next_free;

    void resync(clock::time_point now) noexcept;
public:
    explicit stream_rate_limiter(double rate, clock::time_point now = clock::now());

    // bytes per second, 0 is unlimited
    double rate() const noexcept {
        return _rate;
    }

    void set_rate(double rate, clock::time_point now = clock::now());

    // Reserves n bytes. Returns how long the caller has to wait before
    // it may use them.
    clock::duration reserve(uint64_t n, clock::time_point now = clock::now()) noexcept;

    future<> acquire(uint64_t n);
};

/**
 * The stream rate limiters of one shard, one per peer.
 *
 * The configured throughput is a node-wide budget; every shard enforces
 * its even share of it. The configuration is read again on every call, so
 * a changed value applies to limiters created earlier as well.
 */
class stream_rate_limiter_registry {
    utils::updateable_value<uint32_t> _throughput_mbits;
    unsigned _shard_count;
    std::unordered_map<gms::inet_address, lw_shared_ptr<stream_rate_limiter>> _limiters;
public:
    explicit stream_rate_limiter_registry(utils::updateable_value<uint32_t> throughput_mbits, unsigned shard_count = smp::count);

    // Bytes per second this shard may send to a single peer, 0 is unlimited.
    double current_rate() const;

    // Created on first use and kept for the lifetime of the registry, so
    // the same peer always gets the same limiter.
    lw_shared_ptr<stream_rate_limiter> get_rate_limiter(gms::inet_address peer);

    future<> acquire(gms::inet_address peer, uint64_t bytes);

    size_t size() const noexcept {
        return _limiters.size();
    }
};

}
