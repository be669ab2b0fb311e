#pragma once

#include "craftwire/buffer/FramedRing.hpp"
#include "craftwire/memory/BlockAllocator.hpp"
#include "craftwire/net/Socket.hpp"
#include "craftwire/protocol/Packet.hpp"
#include "craftwire/protocol/PacketEncoder.hpp"
#include "craftwire/protocol/Packetizer.hpp"

#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace craftwire {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

struct ConnectionLimits {
    size_t max_frame_size = 2097152;
    size_t max_packet_size = 8388608;
    uint8_t ring_bits = 4;
};

/*
 One peer. Owns the socket, the receive and send pipelines, and the ring
 that batches of received packets are handed out from.

 Batches borrow from the connection: drop them before it goes away.
*/
class Connection {
public:
    using Batch = FramedRing<Packet>::Reader;

    // Called for each packet before the next frame is decoded. It may
    // switch compression or encryption for the frames behind it.
    using PacketHook = std::function<void(const Packet&)>;

    Connection(boost::asio::ip::tcp::socket socket, BlockAllocator& alloc,
               const ConnectionLimits& limits = ConnectionLimits{});

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Every packet that is already buffered, reading from the socket only
    // while none is. nullopt on EOF. Throws ProtocolError on framing errors
    // and InflaterError on bad compressed packets.
    std::optional<Batch> read_batch(const PacketHook& on_packet = nullptr);

    void send(Multibytes body);

    void start_compression(int32_t threshold, int level);
    void start_encryption(const AesKey& key);

    boost::asio::ip::tcp::socket& socket() { return socket_; }
    size_t buffered() const { return packetizer_.buffered(); }

private:
    void drain(FramedRing<Packet>::Writer& batch, const PacketHook& on_packet);

    boost::asio::ip::tcp::socket socket_;
    BlockAllocator& alloc_;

    ConnectionSource source_;
    ConnectionSink sink_;

    Packetizer packetizer_;
    PacketEncoder encoder_;
    FramedRing<Packet> ring_;
};

}
