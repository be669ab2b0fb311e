#pragma once

#include "craftwire/buffer/Multibytes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

namespace craftwire {

/*
 A complete packet. header holds the frame as it came off the wire. An
 uncompressed packet's payload lives inside header starting at the Cursor;
 an inflated one owns its payload.
*/
struct Packet {
    Multibytes header;
    std::variant<Cursor, Multibytes> data;

    // Payload, packet id first.
    MultibytesView body() const;
    size_t body_size() const;

    bool compressed() const { return std::holds_alternative<Multibytes>(data); }

    // Leading varint of the payload; nullopt if it is malformed.
    std::optional<int32_t> packet_id() const;
};

}
