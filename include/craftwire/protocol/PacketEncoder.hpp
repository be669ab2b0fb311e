#pragma once

#include "craftwire/buffer/Multibytes.hpp"
#include "craftwire/compress/ZlibPipe.hpp"
#include "craftwire/crypto/Cryptor.hpp"
#include "craftwire/memory/BlockAllocator.hpp"

#include <cstdint>
#include <memory>

namespace craftwire {

/*
 Send pipeline: length prefix, optional compression, optional encryption.
 Takes the body by value and reuses its blocks when nothing has to be
 compressed.
*/
class PacketEncoder {
public:
    PacketEncoder() = default;

    // Negative threshold turns compression off again.
    void start_compression(int32_t threshold, int level);
    void start_encryption(const AesKey& key);

    Multibytes encode(Multibytes body, BlockAllocator& alloc);

    bool compression() const { return threshold_ >= 0; }

private:
    Deflater& pipe(BlockAllocator& alloc);

    int32_t threshold_ = -1;
    int level_ = 6;

    std::unique_ptr<Deflater> pipe_;
    BlockAllocator* pipe_alloc_ = nullptr;

    Cryptor encrypt_{CryptMode::ENCRYPT};
};

}
