/*
 * Copyright (C) 2016-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/net/inet_address.hh>
#include <seastar/net/dns.hh>
#include <seastar/core/coroutine.hh>
#include "gms/inet_address.hh"

using namespace seastar;

static_assert(std::is_nothrow_default_constructible_v<gms::inet_address>);
static_assert(std::is_nothrow_copy_constructible_v<gms::inet_address>);
static_assert(std::is_nothrow_move_constructible_v<gms::inet_address>);

future<gms::inet_address> gms::inet_address::lookup(sstring name) {
    if (name == "localhost") {
        co_return inet_address(name);
    }
    if (auto literal = net::inet_address::parse_numerical(name)) {
        co_return inet_address(*literal);
    }
    auto h = co_await net::dns::get_host_by_name(name);
    if (h.addr_list.empty()) {
        throw std::runtime_error(fmt::format("No address found for host {}", name));
    }
    co_return inet_address(h.addr_list.front());
}
