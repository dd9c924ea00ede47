/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/core/byteorder.hh>
#include <seastar/core/coroutine.hh>

#include "streaming/messages/stream_message.hh"
#include "streaming/messages/prepare_message.hh"
#include "streaming/messages/file_message.hh"
#include "streaming/messages/retry_message.hh"
#include "streaming/messages/complete_message.hh"
#include "streaming/messages/stream_init_message.hh"

namespace streaming::messages {

// type byte + payload length
static constexpr size_t envelope_header_size = 1 + sizeof(uint32_t);

void check_version(protocol_version version) {
    if (version > current_version) {
        throw protocol_exception(format("Unsupported streaming protocol version {}, this node speaks up to {}", version, current_version));
    }
}

int stream_message::priority() const {
    return stream_message_registry::default_registry().get(uint8_t(_type)).priority;
}

void stream_message_registry::register_type(stream_message_type type, int priority, std::unique_ptr<stream_message_serializer> serializer) {
    auto& e = _entries[uint8_t(type)];
    if (e) {
        throw std::invalid_argument(format("Stream message type {} is already registered", uint8_t(type)));
    }
    e.emplace(entry{priority, std::move(serializer)});
}

const stream_message_registry::entry* stream_message_registry::find(uint8_t tag) const noexcept {
    auto& e = _entries[tag];
    return e ? &*e : nullptr;
}

const stream_message_registry::entry& stream_message_registry::get(uint8_t tag) const {
    auto e = find(tag);
    if (!e) {
        throw protocol_exception(format("Unknown stream message type {}", tag));
    }
    return *e;
}

static stream_message_registry make_default_registry() {
    stream_message_registry r;
    r.register_type<prepare_message>(stream_message_type::PREPARE, 5);
    r.register_type<file_message>(stream_message_type::FILE, 0);
    r.register_type<retry_message>(stream_message_type::RETRY, 1);
    r.register_type<complete_message>(stream_message_type::COMPLETE, 4);
    r.register_type<session_failed_message>(stream_message_type::SESSION_FAILED, 5);
    return r;
}

const stream_message_registry& stream_message_registry::default_registry() {
    static const stream_message_registry registry = make_default_registry();
    return registry;
}

static void check_payload_size(uint64_t size) {
    if (size > max_payload_size) {
        throw protocol_exception(format("Stream message payload of {} bytes exceeds the limit of {}", size, max_payload_size));
    }
}

// Decodes exactly len bytes with the given reader. Running short or
// leaving bytes behind are both protocol violations.
template <typename Func>
static auto decode_exactly(const char* data, size_t len, Func&& func) {
    seastar::simple_input_stream in(data, len);
    try {
        auto ret = func(in);
        if (in.size()) {
            throw protocol_exception(format("{} unexpected trailing bytes in stream message", in.size()));
        }
        return ret;
    } catch (std::out_of_range&) {
        throw protocol_exception("Truncated stream message");
    }
}

temporary_buffer<char> serialize(const stream_message& msg, protocol_version version, const stream_message_registry& registry) {
    check_version(version);
    auto& e = registry.get(uint8_t(msg.type()));
    auto payload_size = e.serializer->serialized_size(msg, version);
    check_payload_size(payload_size);
    temporary_buffer<char> buf(envelope_header_size + payload_size);
    seastar::simple_output_stream out(buf.get_write(), buf.size());
    ser::serialize(out, uint8_t(msg.type()));
    ser::serialize(out, uint32_t(payload_size));
    e.serializer->serialize(msg, out, version);
    return buf;
}

stream_message_ptr deserialize(const char* data, size_t size, protocol_version version, const stream_message_registry& registry) {
    check_version(version);
    if (size < envelope_header_size) {
        throw protocol_exception("Truncated stream message header");
    }
    auto& e = registry.get(uint8_t(data[0]));
    auto len = read_le<uint32_t>(data + 1);
    check_payload_size(len);
    if (len != size - envelope_header_size) {
        throw protocol_exception(format("Stream message announces {} bytes of payload but {} are present", len, size - envelope_header_size));
    }
    return decode_exactly(data + envelope_header_size, len, [&] (seastar::simple_input_stream& is) {
        return e.serializer->deserialize(is, version);
    });
}

future<> write_message(output_stream<char>& out, const stream_message& msg, protocol_version version, const stream_message_registry& registry) {
    return out.write(serialize(msg, version, registry));
}

future<stream_message_ptr> read_message(input_stream<char>& in, protocol_version version, const stream_message_registry& registry) {
    check_version(version);
    auto head = co_await in.read_exactly(envelope_header_size);
    if (head.empty()) {
        co_return nullptr;
    }
    if (head.size() != envelope_header_size) {
        throw protocol_exception("Connection closed in the middle of a stream message header");
    }
    auto& e = registry.get(uint8_t(head[0]));
    auto len = read_le<uint32_t>(head.get() + 1);
    check_payload_size(len);
    auto payload = co_await in.read_exactly(len);
    if (payload.size() != len) {
        throw protocol_exception("Connection closed in the middle of a stream message");
    }
    co_return decode_exactly(payload.get(), len, [&] (seastar::simple_input_stream& is) {
        return e.serializer->deserialize(is, version);
    });
}

future<> write_handshake(output_stream<char>& out, const stream_init_message& init, protocol_version version) {
    auto body_size = ser::get_sizeof(init);
    temporary_buffer<char> buf(1 + sizeof(uint32_t) + body_size);
    seastar::simple_output_stream os(buf.get_write(), buf.size());
    ser::serialize(os, uint8_t(version));
    ser::serialize(os, uint32_t(body_size));
    ser::serialize(os, init);
    co_await out.write(std::move(buf));
    co_await out.flush();
}

future<std::optional<protocol_version>> read_version(input_stream<char>& in) {
    auto b = co_await in.read_exactly(1);
    if (b.empty()) {
        co_return std::nullopt;
    }
    co_return protocol_version(b[0]);
}

future<stream_init_message> read_init_message(input_stream<char>& in, protocol_version version) {
    check_version(version);
    auto head = co_await in.read_exactly(sizeof(uint32_t));
    if (head.size() != sizeof(uint32_t)) {
        throw protocol_exception("Connection closed before the stream init message");
    }
    auto len = read_le<uint32_t>(head.get());
    check_payload_size(len);
    auto body = co_await in.read_exactly(len);
    if (body.size() != len) {
        throw protocol_exception("Connection closed in the middle of the stream init message");
    }
    co_return decode_exactly(body.get(), len, [] (seastar::simple_input_stream& is) {
        return ser::deserialize(is, boost::type<stream_init_message>());
    });
}

} // namespace streaming::messages

auto fmt::formatter<streaming::messages::stream_message_type>::format(streaming::messages::stream_message_type t, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using smt = streaming::messages::stream_message_type;
    std::string_view name = "UNKNOWN";
    switch (t) {
    case smt::PREPARE: name = "PREPARE"; break;
    case smt::FILE: name = "FILE"; break;
    case smt::RETRY: name = "RETRY"; break;
    case smt::COMPLETE: name = "COMPLETE"; break;
    case smt::SESSION_FAILED: name = "SESSION_FAILED"; break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
}
