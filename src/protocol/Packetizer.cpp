#include "craftwire/protocol/Packetizer.hpp"

#include <utility>

namespace craftwire {

Packetizer::Packetizer(size_t max_frame_size, size_t max_packet_size)
    : framer_(max_frame_size), inflater_(max_packet_size) {}

void Packetizer::feed(Part data) {
    decrypt_.process(data.data(), data.size());
    framer_.feed(std::move(data));
}

PacketResult Packetizer::next(BlockAllocator& alloc) {
    FrameResult f = framer_.next();

    PacketResult r;
    r.status = f.status;
    r.waiting_for = f.waiting_for;
    if (f.ready()) {
        r.packet = inflater_.inflate(std::move(*f.frame), alloc);
    }
    return r;
}

void Packetizer::start_compression(int32_t threshold) {
    inflater_.start_compression(threshold);
}

void Packetizer::start_encryption(const AesKey& key) {
    decrypt_.start_crypto(key);
    framer_.for_each_pending([this](uint8_t* data, size_t len) {
        decrypt_.process(data, len);
    });
}

}
