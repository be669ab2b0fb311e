#include "craftwire/net/Connection.hpp"

#include <iostream>
#include <utility>

namespace craftwire {

Connection::Connection(boost::asio::ip::tcp::socket socket, BlockAllocator& alloc,
                       const ConnectionLimits& limits)
    : socket_(std::move(socket)),
      alloc_(alloc),
      source_(socket_),
      sink_(socket_),
      packetizer_(limits.max_frame_size, limits.max_packet_size),
      ring_(limits.ring_bits) {}

std::optional<Connection::Batch> Connection::read_batch(const PacketHook& on_packet) {
    auto batch = ring_.frame();
    drain(batch, on_packet);

    while (batch.size() == 0) {
        ReadResult r = source_.read(alloc_);
        if (r.eof()) {
            if (packetizer_.buffered() > 0) {
                std::cerr << "[CONN] peer closed with " << packetizer_.buffered()
                          << " bytes of a partial frame\n";
            }
            return std::nullopt;
        }
        packetizer_.feed(std::move(r.data));
        drain(batch, on_packet);
    }
    return batch.seal();
}

void Connection::drain(FramedRing<Packet>::Writer& batch, const PacketHook& on_packet) {
    for (;;) {
        PacketResult p = packetizer_.next(alloc_);
        if (p.status == FrameStatus::DECODE_ERROR) {
            throw ProtocolError("undecodable frame after " +
                                std::to_string(batch.size()) + " packets in batch");
        }
        if (!p.ready()) return;
        if (on_packet) on_packet(*p.packet);
        batch.append(std::move(*p.packet));
    }
}

void Connection::send(Multibytes body) {
    sink_.write(encoder_.encode(std::move(body), alloc_));
}

void Connection::start_compression(int32_t threshold, int level) {
    std::cout << "[CONN] compression threshold " << threshold << " level " << level << "\n";
    packetizer_.start_compression(threshold);
    encoder_.start_compression(threshold, level);
}

void Connection::start_encryption(const AesKey& key) {
    std::cout << "[CONN] encryption on\n";
    packetizer_.start_encryption(key);
    encoder_.start_encryption(key);
}

}
