#include "craftwire/protocol/PacketInflater.hpp"
#include "craftwire/protocol/Varint.hpp"

#include <utility>

namespace craftwire {

InflaterError::InflaterError(Kind kind, const std::string& what)
    : std::runtime_error(std::string(to_string(kind)) + ": " + what), kind_(kind) {}

const char* to_string(InflaterError::Kind k) {
    switch (k) {
        case InflaterError::Kind::COMPRESSION_SIZE_DECODE_FAIL: return "COMPRESSION_SIZE_DECODE_FAIL";
        case InflaterError::Kind::SMALL_COMPRESSION:            return "SMALL_COMPRESSION";
        case InflaterError::Kind::OVERSIZED_PACKET:             return "OVERSIZED_PACKET";
        case InflaterError::Kind::SIZE_MISMATCH:                return "SIZE_MISMATCH";
        case InflaterError::Kind::ZLIB:                         return "ZLIB";
    }
    return "UNKNOWN";
}

PacketInflater::PacketInflater(size_t max_packet_size)
    : max_packet_size_(max_packet_size) {}

void PacketInflater::start_compression(int32_t threshold) {
    threshold_ = threshold < 0 ? -1 : threshold;
}

Inflater& PacketInflater::pipe(BlockAllocator& alloc) {
    if (!pipe_ || pipe_alloc_ != &alloc) {
        pipe_ = std::make_unique<Inflater>(alloc);
        pipe_alloc_ = &alloc;
    }
    return *pipe_;
}

Packet PacketInflater::inflate(Frame frame, BlockAllocator& alloc) {
    if (!compression()) {
        return Packet{std::move(frame.packet), frame.data_start};
    }

    MultibytesView in = frame.packet.view_at(frame.data_start);
    const ParseResult<int32_t> len = varint(in);
    if (!len.ok() || len.value < 0) {
        throw InflaterError(
            InflaterError::Kind::COMPRESSION_SIZE_DECODE_FAIL,
            "bad data length prefix"
        );
    }

    if (len.value == 0) {
        const Cursor body = in.cursor();
        return Packet{std::move(frame.packet), body};
    }

    if (len.value < threshold_) {
        throw InflaterError(
            InflaterError::Kind::SMALL_COMPRESSION,
            std::to_string(len.value) + " bytes compressed under threshold " +
                std::to_string(threshold_)
        );
    }

    const size_t expected = static_cast<size_t>(len.value);
    if (expected > max_packet_size_) {
        throw InflaterError(
            InflaterError::Kind::OVERSIZED_PACKET,
            std::to_string(expected) + " > " + std::to_string(max_packet_size_)
        );
    }

    Multibytes body;
    try {
        body = pipe(alloc).process(in, FlushMode::FINISH, expected);
    } catch (const ZlibError& e) {
        throw InflaterError(InflaterError::Kind::ZLIB, e.what());
    }

    if (body.size() != expected) {
        throw InflaterError(
            InflaterError::Kind::SIZE_MISMATCH,
            "declared " + std::to_string(expected) + ", inflated " +
                std::to_string(body.size())
        );
    }

    return Packet{std::move(frame.packet), std::move(body)};
}

}
