/*
 * Copyright 2016-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <vector>
#include <utility>
#include <limits>
#include <stdexcept>

#include <seastar/core/sstring.hh>
#include <seastar/core/simple-stream.hh>
#include <seastar/core/byteorder.hh>

#include <boost/type.hpp>

#include "seastarx.hh"
#include "utils/UUID.hh"

namespace ser {

using size_type = uint32_t;

template<typename T, typename Input>
inline T deserialize_integral(Input& input) {
    static_assert(std::is_integral<T>::value, "T should be integral");
    T data;
    input.read(reinterpret_cast<char*>(&data), sizeof(T));
    return le_to_cpu(data);
}

template<typename T, typename Output>
inline void serialize_integral(Output& output, T data) {
    static_assert(std::is_integral<T>::value, "T should be integral");
    data = cpu_to_le(data);
    output.write(reinterpret_cast<const char*>(&data), sizeof(T));
}

template<typename T>
struct serializer;

template<typename T>
struct integral_serializer {
    template<typename Input>
    static T read(Input& v) {
        return deserialize_integral<T>(v);
    }
    template<typename Output>
    static void write(Output& out, T v) {
        serialize_integral(out, v);
    }
};

template<> struct serializer<bool> {
    template <typename Input>
    static bool read(Input& i) {
        return deserialize_integral<uint8_t>(i);
    }
    template< typename Output>
    static void write(Output& out, bool v) {
        serialize_integral(out, uint8_t(v));
    }
};
template<> struct serializer<int8_t> : public integral_serializer<int8_t> {};
template<> struct serializer<uint8_t> : public integral_serializer<uint8_t> {};
template<> struct serializer<int16_t> : public integral_serializer<int16_t> {};
template<> struct serializer<uint16_t> : public integral_serializer<uint16_t> {};
template<> struct serializer<int32_t> : public integral_serializer<int32_t> {};
template<> struct serializer<uint32_t> : public integral_serializer<uint32_t> {};
template<> struct serializer<int64_t> : public integral_serializer<int64_t> {};
template<> struct serializer<uint64_t> : public integral_serializer<uint64_t> {};

template<typename T, typename Output>
inline void serialize(Output& out, const T& v) {
    serializer<T>::write(out, v);
};

template<typename T, typename Output>
inline void serialize(Output& out, const std::reference_wrapper<T> v) {
    serializer<T>::write(out, v.get());
}

template<typename T, typename Input>
inline auto deserialize(Input& in, boost::type<T> t) {
    return serializer<T>::read(in);
}


template<typename Output>
void safe_serialize_as_uint32(Output& out, uint64_t data) {
    if (data > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error(format("Value is too big for serialization: {}", data));
    }
    serialize(out, uint32_t(data));
}

template<>
struct serializer<sstring> {
    template<typename Input>
    static sstring read(Input& in) {
        auto sz = deserialize(in, boost::type<uint32_t>());
        sstring v = uninitialized_string(sz);
        in.read(v.data(), sz);
        return v;
    }
    template<typename Output>
    static void write(Output& out, const sstring& v) {
        safe_serialize_as_uint32(out, v.size());
        out.write(v.data(), v.size());
    }
};

template<typename T>
struct serializer<std::vector<T>> {
    template<typename Input>
    static std::vector<T> read(Input& in) {
        auto sz = deserialize(in, boost::type<uint32_t>());
        std::vector<T> v;
        // Do not trust the count to reserve memory: it comes off the wire.
        v.reserve(std::min<size_t>(sz, 1024));
        while (sz--) {
            v.push_back(deserialize(in, boost::type<T>()));
        }
        return v;
    }
    template<typename Output>
    static void write(Output& out, const std::vector<T>& v) {
        safe_serialize_as_uint32(out, v.size());
        for (auto&& e : v) {
            serialize(out, e);
        }
    }
};

template<typename T1, typename T2>
struct serializer<std::pair<T1, T2>> {
    template<typename Input>
    static std::pair<T1, T2> read(Input& in) {
        auto first = deserialize(in, boost::type<T1>());
        auto second = deserialize(in, boost::type<T2>());
        return std::make_pair(std::move(first), std::move(second));
    }
    template<typename Output>
    static void write(Output& out, const std::pair<T1, T2>& v) {
        serialize(out, v.first);
        serialize(out, v.second);
    }
};

template<>
struct serializer<utils::UUID> {
    template<typename Input>
    static utils::UUID read(Input& in) {
        auto msb = deserialize(in, boost::type<int64_t>());
        auto lsb = deserialize(in, boost::type<int64_t>());
        return utils::UUID(msb, lsb);
    }
    template<typename Output>
    static void write(Output& out, const utils::UUID& v) {
        serialize(out, v.get_most_significant_bits());
        serialize(out, v.get_least_significant_bits());
    }
};

template<typename Tag>
struct serializer<utils::tagged_uuid<Tag>> {
    template<typename Input>
    static utils::tagged_uuid<Tag> read(Input& in) {
        return utils::tagged_uuid<Tag>(deserialize(in, boost::type<utils::UUID>()));
    }
    template<typename Output>
    static void write(Output& out, const utils::tagged_uuid<Tag>& v) {
        serialize(out, v.uuid());
    }
};

// Returns the number of bytes serialize(out, obj) writes.
template<typename T>
size_type get_sizeof(const T& obj) {
    seastar::measuring_output_stream out;
    serialize(out, obj);
    auto size = out.size();
    if (size > std::numeric_limits<size_type>::max()) {
        throw std::runtime_error(format("Object is too big for get_sizeof: {}", size));
    }
    return size;
}

}
