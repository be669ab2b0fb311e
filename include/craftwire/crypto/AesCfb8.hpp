#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

struct evp_cipher_ctx_st;

namespace craftwire {

using AesKey = std::array<uint8_t, 16>;

enum class CryptMode : uint8_t {
    ENCRYPT = 1,
    DECRYPT = 0
};

// AES-128 in CFB8 mode, the key doubling as IV. Stream state carries over
// from one process() call to the next.
class AesCfb8 {
public:
    AesCfb8(CryptMode mode, const AesKey& key);
    ~AesCfb8();

    AesCfb8(const AesCfb8&) = delete;
    AesCfb8& operator=(const AesCfb8&) = delete;

    // In place.
    void process(uint8_t* data, size_t len);

    CryptMode mode() const { return mode_; }

private:
    CryptMode mode_;
    evp_cipher_ctx_st* ctx_;
};

}
