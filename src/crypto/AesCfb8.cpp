#include "craftwire/crypto/AesCfb8.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <climits>
#include <stdexcept>
#include <string>

namespace craftwire {

namespace {

std::runtime_error openssl_error(const char* op) {
    char buf[256] = {0};
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::runtime_error(std::string(op) + ": " + buf);
}

}

AesCfb8::AesCfb8(CryptMode mode, const AesKey& key)
    : mode_(mode), ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) throw openssl_error("EVP_CIPHER_CTX_new");

    if (EVP_CipherInit_ex(ctx_, EVP_aes_128_cfb8(), nullptr,
                          key.data(), key.data(),
                          static_cast<int>(mode)) != 1) {
        EVP_CIPHER_CTX_free(ctx_);
        throw openssl_error("EVP_CipherInit_ex");
    }
}

AesCfb8::~AesCfb8() {
    EVP_CIPHER_CTX_free(ctx_);
}

void AesCfb8::process(uint8_t* data, size_t len) {
    while (len > 0) {
        const int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        int out_len = 0;
        if (EVP_CipherUpdate(ctx_, data, &out_len, data, chunk) != 1) {
            throw openssl_error("EVP_CipherUpdate");
        }
        if (out_len != chunk) {
            throw std::runtime_error(
                "EVP_CipherUpdate: cfb8 produced " + std::to_string(out_len) +
                " bytes for " + std::to_string(chunk)
            );
        }
        data += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

}
