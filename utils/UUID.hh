/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

// This class is the parts of java.util.UUID that we need

#include <stdint.h>
#include <cassert>
#include <compare>
#include <functional>
#include <string_view>

#include <seastar/core/sstring.hh>
#include <fmt/format.h>

#include "seastarx.hh"

namespace utils {

class UUID {
private:
    int64_t most_sig_bits;
    int64_t least_sig_bits;
public:
    constexpr UUID() noexcept : most_sig_bits(0), least_sig_bits(0) {}
    constexpr UUID(int64_t most_sig_bits, int64_t least_sig_bits) noexcept
        : most_sig_bits(most_sig_bits), least_sig_bits(least_sig_bits) {}

    // May throw std::invalid_argument if the string is not a valid UUID.
    explicit UUID(std::string_view uuid_string);

    int64_t get_most_significant_bits() const noexcept {
        return most_sig_bits;
    }
    int64_t get_least_significant_bits() const noexcept {
        return least_sig_bits;
    }
    int version() const noexcept {
        return (most_sig_bits >> 12) & 0xf;
    }

    bool is_null() const noexcept {
        return !most_sig_bits && !least_sig_bits;
    }

    explicit operator bool() const noexcept {
        return !is_null();
    }

    sstring to_sstring() const;

    bool operator==(const UUID& v) const noexcept = default;

    // Plain lexicographic order of the two halves, as unsigned. Only used to
    // keep maps deterministic.
    std::strong_ordering operator<=>(const UUID& v) const noexcept {
        auto cmp = uint64_t(most_sig_bits) <=> uint64_t(v.most_sig_bits);
        if (cmp != 0) {
            return cmp;
        }
        return uint64_t(least_sig_bits) <=> uint64_t(v.least_sig_bits);
    }
};

// Version 4 (random) UUID.
UUID make_random_uuid() noexcept;

// Version 3 style (name based) UUID. Deterministic for a given name, so
// independent nodes derive the same id for the same name.
UUID make_name_uuid(std::string_view name) noexcept;

template <typename Tag>
struct tagged_uuid {
    utils::UUID id;
    std::strong_ordering operator<=>(const tagged_uuid&) const noexcept = default;
    explicit operator bool() const noexcept {
        // The default constructor sets the id to nil, which is
        // guaranteed to not match any valid id.
        return bool(id);
    }
    static tagged_uuid create_random_id() noexcept { return tagged_uuid{utils::make_random_uuid()}; }
    static tagged_uuid create_null_id() noexcept { return tagged_uuid{}; }
    explicit tagged_uuid(const utils::UUID& uuid) noexcept : id(uuid) {}
    tagged_uuid() = default;

    const utils::UUID& uuid() const noexcept {
        return id;
    }

    sstring to_sstring() const {
        return id.to_sstring();
    }
};

} // namespace utils

template<>
struct std::hash<utils::UUID> {
    size_t operator()(const utils::UUID& id) const noexcept {
        auto hilo = id.get_most_significant_bits()
                ^ id.get_least_significant_bits();
        return size_t((hilo >> 32) ^ hilo);
    }
};

template<typename Tag>
struct std::hash<utils::tagged_uuid<Tag>> {
    size_t operator()(const utils::tagged_uuid<Tag>& id) const noexcept {
        return std::hash<utils::UUID>()(id.id);
    }
};

template <>
struct fmt::formatter<utils::UUID> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const utils::UUID& id, FormatContext& ctx) const {
        uint64_t msb = id.get_most_significant_bits();
        uint64_t lsb = id.get_least_significant_bits();
        return fmt::format_to(ctx.out(), "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                msb >> 32, (msb >> 16) & 0xffff, msb & 0xffff,
                lsb >> 48, lsb & 0xffffffffffffULL);
    }
};

template <typename Tag>
struct fmt::formatter<utils::tagged_uuid<Tag>> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const utils::tagged_uuid<Tag>& id, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", id.id);
    }
};
