/*
 * Copyright (C) 2019-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <atomic>
#include <type_traits>

namespace utils {

// A value that can be changed at runtime (e.g. by reloading the
// configuration file) while consumers keep reading it.
//
// Trivially copyable values are stored atomically, so an
// updateable_value<T> may be read from any shard while the source is
// updated on another. Other types may only change before the consumers
// on other shards start.
template <typename T>
class updateable_value_source {
    static constexpr bool is_atomic = std::is_trivially_copyable_v<T>;
    using storage = std::conditional_t<is_atomic, std::atomic<T>, T>;
    storage _value;
public:
    explicit updateable_value_source(T value = T{}) : _value(std::move(value)) {}

    updateable_value_source(const updateable_value_source&) = delete;
    updateable_value_source& operator=(const updateable_value_source&) = delete;

    void set(T value) {
        if constexpr (is_atomic) {
            _value.store(value, std::memory_order_relaxed);
        } else {
            _value = std::move(value);
        }
    }

    T get() const {
        if constexpr (is_atomic) {
            return _value.load(std::memory_order_relaxed);
        } else {
            return _value;
        }
    }

    T operator()() const {
        return get();
    }
};

// Read-only handle on an updateable_value_source. Cheap to copy; each read
// observes the latest value set on the source.
template <typename T>
class updateable_value {
    const updateable_value_source<T>* _source = nullptr;
    T _fallback{};
public:
    updateable_value() = default;
    // A constant that never changes.
    explicit updateable_value(T value) : _fallback(std::move(value)) {}
    updateable_value(const updateable_value_source<T>& source) : _source(&source) {}

    T get() const {
        return _source ? _source->get() : _fallback;
    }

    T operator()() const {
        return get();
    }
};

}
