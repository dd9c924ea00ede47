/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <chrono>

#include <seastar/core/sleep.hh>
#include <seastar/core/smp.hh>

#include "streaming/stream_rate_limiter.hh"
#include "log.hh"

namespace streaming {

extern logging::logger sslog;

stream_rate_limiter::stream_rate_limiter(double rate, clock::time_point now)
    : _next_free(now) {
    set_rate(rate, now);
    // Nothing is banked at creation.
    _stored = 0;
}

void stream_rate_limiter::resync(clock::time_point now) noexcept {
    if (now > _next_free) {
        if (_rate > 0) {
            auto idle = std::chrono::duration<double>(now - _next_free).count();
            _stored = std::min(_max_stored, _stored + idle * _rate);
        }
        _next_free = now;
    }
}

void stream_rate_limiter::set_rate(double rate, clock::time_point now) {
    if (rate < 0) {
        throw std::invalid_argument(format("Invalid stream rate {}", rate));
    }
    resync(now);
    auto old_max = _max_stored;
    _rate = rate;
    _max_stored = rate * max_burst_seconds;
    if (rate == 0) {
        // Unlimited. Nothing to owe, nothing to bank.
        _stored = 0;
        _next_free = now;
    } else if (old_max > 0) {
        _stored = _stored * _max_stored / old_max;
    } else {
        _stored = 0;
    }
}

stream_rate_limiter::clock::duration stream_rate_limiter::reserve(uint64_t n, clock::time_point now) noexcept {
    if (_rate == 0) {
        return clock::duration::zero();
    }
    resync(now);
    auto start = _next_free;
    double from_stored = std::min(double(n), _stored);
    double fresh = double(n) - from_stored;
    _stored -= from_stored;
    _next_free += std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(fresh / _rate));
    return std::max(start - now, clock::duration::zero());
}

future<> stream_rate_limiter::acquire(uint64_t n) {
    auto wait = reserve(n);
    if (wait <= clock::duration::zero()) {
        return make_ready_future<>();
    }
    return seastar::sleep(wait);
}

stream_rate_limiter_registry::stream_rate_limiter_registry(utils::updateable_value<uint32_t> throughput_mbits, unsigned shard_count)
    : _throughput_mbits(std::move(throughput_mbits))
    , _shard_count(std::max(shard_count, 1u)) {
}

double stream_rate_limiter_registry::current_rate() const {
    double mbits = _throughput_mbits();
    return mbits * 1024 * 1024 / 8 / _shard_count;
}

lw_shared_ptr<stream_rate_limiter> stream_rate_limiter_registry::get_rate_limiter(gms::inet_address peer) {
    auto rate = current_rate();
    auto [it, inserted] = _limiters.try_emplace(peer);
    if (inserted) {
        it->second = make_lw_shared<stream_rate_limiter>(rate);
        sslog.debug("Created stream rate limiter for {}: {} bytes/s", peer, rate);
    } else if (it->second->rate() != rate) {
        sslog.info("Stream throughput to {} changed from {} to {} bytes/s", peer, it->second->rate(), rate);
        it->second->set_rate(rate);
    }
    return it->second;
}

future<> stream_rate_limiter_registry::acquire(gms::inet_address peer, uint64_t bytes) {
    return get_rate_limiter(peer)->acquire(bytes);
}

}
