#pragma once

#include "craftwire/buffer/Multibytes.hpp"
#include "craftwire/crypto/AesCfb8.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace craftwire {

/*
 One direction of a connection's stream cipher. Passes bytes through
 untouched until start_crypto(); from then on every byte handed to
 process() is part of one continuous CFB8 stream.
*/
class Cryptor {
public:
    explicit Cryptor(CryptMode mode) : mode_(mode) {}

    // Throws std::logic_error if already started.
    void start_crypto(const AesKey& key);

    void process(uint8_t* data, size_t len);
    void process(Multibytes& bytes);

    bool active() const { return cipher_ != nullptr; }
    CryptMode mode() const { return mode_; }

private:
    CryptMode mode_;
    std::unique_ptr<AesCfb8> cipher_;
};

}
