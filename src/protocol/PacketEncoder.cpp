#include "craftwire/protocol/PacketEncoder.hpp"
#include "craftwire/protocol/Varint.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace craftwire {

namespace {

constexpr size_t kMaxBody = static_cast<size_t>(std::numeric_limits<int32_t>::max());

void check_len(size_t len) {
    if (len > kMaxBody) {
        throw std::invalid_argument(
            "packet of " + std::to_string(len) + " bytes does not fit a varint length"
        );
    }
}

}

void PacketEncoder::start_compression(int32_t threshold, int level) {
    if (level != level_) {
        pipe_.reset();
        pipe_alloc_ = nullptr;
    }
    threshold_ = threshold < 0 ? -1 : threshold;
    level_ = level;
}

void PacketEncoder::start_encryption(const AesKey& key) {
    encrypt_.start_crypto(key);
}

Deflater& PacketEncoder::pipe(BlockAllocator& alloc) {
    if (!pipe_ || pipe_alloc_ != &alloc) {
        pipe_ = std::make_unique<Deflater>(alloc, level_);
        pipe_alloc_ = &alloc;
    }
    return *pipe_;
}

Multibytes PacketEncoder::encode(Multibytes body, BlockAllocator& alloc) {
    const size_t len = body.size();
    check_len(len);

    uint8_t prefix[2 * kMaxVarintSize + 1];
    size_t n = 0;
    Multibytes payload;

    if (!compression()) {
        n = write_varint(prefix, static_cast<int32_t>(len));
        payload = std::move(body);
    } else if (len == 0 || len < static_cast<size_t>(threshold_)) {
        // A data length of 0 marks an uncompressed body, so empty bodies
        // always go out uncompressed.
        check_len(len + 1);
        n = write_varint(prefix, static_cast<int32_t>(len + 1));
        prefix[n++] = 0x00;
        payload = std::move(body);
    } else {
        payload = pipe(alloc).process(body, FlushMode::FINISH);
        const size_t frame_len = varint_size(static_cast<int32_t>(len)) + payload.size();
        check_len(frame_len);
        n = write_varint(prefix, static_cast<int32_t>(frame_len));
        n += write_varint(prefix + n, static_cast<int32_t>(len));
    }

    Multibytes wire = Multibytes::copy_of(alloc, prefix, n);
    wire.append(std::move(payload));
    encrypt_.process(wire);
    return wire;
}

}
