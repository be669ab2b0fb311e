#include "craftwire/crypto/Cryptor.hpp"

#include <stdexcept>

namespace craftwire {

void Cryptor::start_crypto(const AesKey& key) {
    if (cipher_) throw std::logic_error("stream cipher already started");
    cipher_ = std::make_unique<AesCfb8>(mode_, key);
}

void Cryptor::process(uint8_t* data, size_t len) {
    if (!cipher_ || len == 0) return;
    cipher_->process(data, len);
}

void Cryptor::process(Multibytes& bytes) {
    if (!cipher_) return;
    for (auto& page : bytes.pages()) {
        process(page.data(), page.size());
    }
}

}
