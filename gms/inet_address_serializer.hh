/*
 * Copyright (C) 2019-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/net/ipv4_address.hh>
#include <seastar/net/ipv6_address.hh>
#include "gms/inet_address.hh"
#include "serializer.hh"

namespace ser {

/**
 * inet_address wire format:
 *
 * ipv4: 4  bytes address
 * ipv6: 4  bytes marker 0xffffffff (invalid address)
 *       16 bytes data -> address
 */
template<>
struct serializer<gms::inet_address> {
    template<typename Input>
    static gms::inet_address read(Input& in) {
        auto sz = deserialize(in, boost::type<uint32_t>());
        if (sz == std::numeric_limits<uint32_t>::max()) {
            net::ipv6_address::ipv6_bytes bytes;
            in.read(reinterpret_cast<char*>(bytes.data()), bytes.size());
            return gms::inet_address(net::inet_address(net::ipv6_address(bytes)));
        }
        return gms::inet_address(sz);
    }
    template<typename Output>
    static void write(Output& out, gms::inet_address v) {
        auto& addr = v.addr();
        if (addr.is_ipv6()) {
            serialize(out, std::numeric_limits<uint32_t>::max());
            out.write(reinterpret_cast<const char*>(addr.data()), addr.size());
        } else {
            uint32_t ip = addr.as_ipv4_address().ip;
            // must write this little (or rather host) endian
            serialize(out, ip);
        }
    }
};

}
