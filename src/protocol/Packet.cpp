#include "craftwire/protocol/Packet.hpp"
#include "craftwire/protocol/Varint.hpp"

namespace craftwire {

MultibytesView Packet::body() const {
    if (const Cursor* c = std::get_if<Cursor>(&data)) {
        return header.view_at(*c);
    }
    return std::get<Multibytes>(data).view();
}

size_t Packet::body_size() const {
    return body().remaining();
}

std::optional<int32_t> Packet::packet_id() const {
    MultibytesView v = body();
    ParseResult<int32_t> id = varint(v);
    if (!id.ok()) return std::nullopt;
    return id.value;
}

}
