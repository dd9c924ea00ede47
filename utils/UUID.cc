/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "utils/UUID.hh"

#include <random>
#include <stdexcept>
#include <fmt/format.h>

namespace utils {

static int64_t parse_hex_run(std::string_view s) {
    uint64_t v = 0;
    for (char c : s) {
        v <<= 4;
        if (c >= '0' && c <= '9') {
            v |= c - '0';
        } else if (c >= 'a' && c <= 'f') {
            v |= c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            v |= c - 'A' + 10;
        } else {
            throw std::invalid_argument(fmt::format("invalid UUID character '{}'", c));
        }
    }
    return int64_t(v);
}

UUID::UUID(std::string_view uuid) {
    // 8-4-4-4-12
    if (uuid.size() != 36 || uuid[8] != '-' || uuid[13] != '-' || uuid[18] != '-' || uuid[23] != '-') {
        throw std::invalid_argument(fmt::format("invalid UUID: '{}'", uuid));
    }
    auto msb = (uint64_t(parse_hex_run(uuid.substr(0, 8))) << 32)
             | (uint64_t(parse_hex_run(uuid.substr(9, 4))) << 16)
             | uint64_t(parse_hex_run(uuid.substr(14, 4)));
    auto lsb = (uint64_t(parse_hex_run(uuid.substr(19, 4))) << 48)
             | uint64_t(parse_hex_run(uuid.substr(24, 12)));
    most_sig_bits = int64_t(msb);
    least_sig_bits = int64_t(lsb);
}

sstring UUID::to_sstring() const {
    return fmt::to_string(*this);
}

UUID make_random_uuid() noexcept {
    static thread_local std::mt19937_64 engine(std::random_device().operator()());
    static thread_local std::uniform_int_distribution<int64_t> dist;
    uint64_t msb = dist(engine);
    uint64_t lsb = dist(engine);
    msb &= ~uint64_t(0xf000);
    msb |= 0x4000; // version 4
    lsb &= ~(uint64_t(0x3) << 62);
    lsb |= uint64_t(0x2) << 62; // IETF variant
    return UUID(int64_t(msb), int64_t(lsb));
}

static uint64_t fnv1a(std::string_view name, uint64_t offset) noexcept {
    constexpr uint64_t prime = 0x100000001b3ull;
    uint64_t hash = offset;
    for (char c : name) {
        hash ^= uint8_t(c);
        hash *= prime;
    }
    return hash;
}

UUID make_name_uuid(std::string_view name) noexcept {
    uint64_t msb = fnv1a(name, 0xcbf29ce484222325ull);
    uint64_t lsb = fnv1a(name, 0x84222325cbf29ce4ull);
    msb &= ~uint64_t(0xf000);
    msb |= 0x3000; // version 3
    lsb &= ~(uint64_t(0x3) << 62);
    lsb |= uint64_t(0x2) << 62;
    return UUID(int64_t(msb), int64_t(lsb));
}

}
