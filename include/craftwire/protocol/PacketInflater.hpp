#pragma once

#include "craftwire/compress/ZlibPipe.hpp"
#include "craftwire/memory/BlockAllocator.hpp"
#include "craftwire/protocol/Framer.hpp"
#include "craftwire/protocol/Packet.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace craftwire {

class InflaterError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        COMPRESSION_SIZE_DECODE_FAIL = 0, // data-length varint bad or negative
        SMALL_COMPRESSION = 1,            // compressed below the threshold
        OVERSIZED_PACKET = 2,             // declared size over the limit
        SIZE_MISMATCH = 3,                // inflated size differs from declared
        ZLIB = 4
    };

    InflaterError(Kind kind, const std::string& what);

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* to_string(InflaterError::Kind k);

/*
 Turns frames into packets. With compression on, every frame starts with
 the uncompressed data length: zero means the rest is sent as is, anything
 else is a zlib stream of exactly that many bytes.
*/
class PacketInflater {
public:
    explicit PacketInflater(size_t max_packet_size);

    // Negative threshold turns compression off again.
    void start_compression(int32_t threshold);

    Packet inflate(Frame frame, BlockAllocator& alloc);

    bool compression() const { return threshold_ >= 0; }
    int32_t threshold() const { return threshold_; }
    size_t max_packet_size() const { return max_packet_size_; }

private:
    Inflater& pipe(BlockAllocator& alloc);

    size_t max_packet_size_;
    int32_t threshold_ = -1;

    std::unique_ptr<Inflater> pipe_;
    BlockAllocator* pipe_alloc_ = nullptr;
};

}
