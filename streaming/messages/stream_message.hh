/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <array>
#include <memory>
#include <optional>

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/simple-stream.hh>
#include <seastar/core/temporary_buffer.hh>
#include <fmt/core.h>

#include "seastarx.hh"
#include "serializer.hh"
#include "streaming/stream_exception.hh"

namespace streaming::messages {

using protocol_version = uint8_t;

// Version of the streaming protocol spoken by this node. Sent as the very
// first byte of every connection.
constexpr protocol_version current_version = 1;

// Upper bound for an envelope payload. Files travel outside the envelope,
// so anything larger means a corrupt or hostile stream.
constexpr uint32_t max_payload_size = 64 * 1024 * 1024;

enum class stream_message_type : uint8_t {
    PREPARE = 1,
    FILE = 2,
    RETRY = 3,
    COMPLETE = 4,
    SESSION_FAILED = 5,
};

/**
 * A message exchanged by two stream sessions. Concrete messages carry the
 * type tag they are registered under.
 */
class stream_message {
    stream_message_type _type;
protected:
    explicit stream_message(stream_message_type type) noexcept : _type(type) {}
public:
    virtual ~stream_message() = default;

    stream_message_type type() const noexcept {
        return _type;
    }

    // Dispatch priority, higher is sent first.
    int priority() const;
};

using stream_message_ptr = std::unique_ptr<stream_message>;

// Encodes and decodes the payload of one message type.
class stream_message_serializer {
public:
    virtual ~stream_message_serializer() = default;
    virtual size_t serialized_size(const stream_message& msg, protocol_version version) const = 0;
    virtual void serialize(const stream_message& msg, seastar::simple_output_stream& out, protocol_version version) const = 0;
    virtual stream_message_ptr deserialize(seastar::simple_input_stream& in, protocol_version version) const = 0;
};

// Adapts a message class with a ser::serializer<> specialization.
template <typename Message>
class message_serializer final : public stream_message_serializer {
public:
    size_t serialized_size(const stream_message& msg, protocol_version version) const override {
        return ser::get_sizeof(static_cast<const Message&>(msg));
    }
    void serialize(const stream_message& msg, seastar::simple_output_stream& out, protocol_version version) const override {
        ser::serialize(out, static_cast<const Message&>(msg));
    }
    stream_message_ptr deserialize(seastar::simple_input_stream& in, protocol_version version) const override {
        return std::make_unique<Message>(ser::deserialize(in, boost::type<Message>()));
    }
};

/**
 * Maps a message type tag to its priority and serializer. Encoding and
 * decoding only look tags up here, so a new message kind is added by
 * registering it.
 */
class stream_message_registry {
public:
    struct entry {
        int priority;
        std::unique_ptr<stream_message_serializer> serializer;
    };
private:
    std::array<std::optional<entry>, 256> _entries;
public:
    // Throws std::invalid_argument if the tag is already taken.
    void register_type(stream_message_type type, int priority, std::unique_ptr<stream_message_serializer> serializer);

    template <typename Message>
    void register_type(stream_message_type type, int priority) {
        register_type(type, priority, std::make_unique<message_serializer<Message>>());
    }

    // nullptr for unknown tags.
    const entry* find(uint8_t tag) const noexcept;

    // Throws protocol_exception for unknown tags.
    const entry& get(uint8_t tag) const;

    // The registry holding every message type of the current protocol.
    static const stream_message_registry& default_registry();
};

/// Encodes msg into a complete envelope: [type:1][length:4][payload].
/// For a File message only the header is encoded; the section bytes are
/// written separately, right after the envelope.
temporary_buffer<char> serialize(const stream_message& msg, protocol_version version,
        const stream_message_registry& registry = stream_message_registry::default_registry());

/// Decodes one envelope. Throws protocol_exception on an unknown type, a
/// truncated or oversized payload, trailing bytes or a newer version.
stream_message_ptr deserialize(const char* data, size_t size, protocol_version version,
        const stream_message_registry& registry = stream_message_registry::default_registry());

future<> write_message(output_stream<char>& out, const stream_message& msg, protocol_version version,
        const stream_message_registry& registry = stream_message_registry::default_registry());

/// Reads one envelope. Resolves to nullptr when the peer closed the
/// connection cleanly between two messages.
future<stream_message_ptr> read_message(input_stream<char>& in, protocol_version version,
        const stream_message_registry& registry = stream_message_registry::default_registry());

// Throws protocol_exception if version is newer than current_version.
void check_version(protocol_version version);

} // namespace streaming::messages

template <> struct fmt::formatter<streaming::messages::stream_message_type> : fmt::formatter<string_view> {
    auto format(streaming::messages::stream_message_type, fmt::format_context& ctx) const -> decltype(ctx.out());
};
