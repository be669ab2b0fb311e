#pragma once

#include "craftwire/crypto/Cryptor.hpp"
#include "craftwire/memory/BlockAllocator.hpp"
#include "craftwire/protocol/Framer.hpp"
#include "craftwire/protocol/Packet.hpp"
#include "craftwire/protocol/PacketInflater.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace craftwire {

struct PacketResult {
    FrameStatus status = FrameStatus::WAITING_FOR_HEADER;
    size_t waiting_for = 0;
    std::optional<Packet> packet;

    bool ready() const { return status == FrameStatus::READY; }
};

/*
 Receive pipeline: decrypt, frame, inflate.

 Settings changes take effect at the next frame handed out, so a caller
 that switches compression or encryption right after the packet that
 announced it gets the following packets right even if they were already
 buffered. InflaterError propagates out of next().
*/
class Packetizer {
public:
    Packetizer(size_t max_frame_size, size_t max_packet_size);

    void feed(Part data);

    PacketResult next(BlockAllocator& alloc);

    void start_compression(int32_t threshold);

    // Also decrypts whatever is buffered but not yet framed.
    void start_encryption(const AesKey& key);

    bool failed() const { return framer_.failed(); }
    size_t buffered() const { return framer_.buffered(); }

private:
    Framer framer_;
    PacketInflater inflater_;
    Cryptor decrypt_{CryptMode::DECRYPT};
};

}
