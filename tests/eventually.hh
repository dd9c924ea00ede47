/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/sleep.hh>

// Must be called from a seastar thread.
template<typename EventuallySucceedingFunction>
void eventually(EventuallySucceedingFunction&& f, size_t max_attempts = 12) {
    size_t attempts = 0;
    while (true) {
        try {
            f();
            break;
        } catch (...) {
            if (++attempts < max_attempts) {
                seastar::sleep(std::chrono::milliseconds(1 << attempts)).get();
            } else {
                throw;
            }
        }
    }
}

template<typename EventuallySucceedingFunction>
bool eventually_true(EventuallySucceedingFunction&& f, unsigned max_attempts = 12) {
    unsigned attempts = 0;
    while (true) {
        if (f()) {
            return true;
        }

        if (++attempts < max_attempts) {
            seastar::sleep(std::chrono::milliseconds(1 << attempts)).get();
        } else {
            return false;
        }
    }
}

#define REQUIRE_EVENTUALLY_EQUAL(a, b) BOOST_REQUIRE(eventually_true([&] { return a == b; }))
