#include "craftwire/protocol/Varint.hpp"

namespace craftwire {

namespace {

template<typename U>
size_t encoded_size(U v) {
    size_t n = 1;
    while (v >>= 7) {
        ++n;
    }
    return n;
}

template<typename U>
size_t encode(uint8_t* out, U v) {
    size_t n = 0;
    while (v >= 0x80) {
        out[n++] = static_cast<uint8_t>(v & 0x7f) | 0x80;
        v >>= 7;
    }
    out[n++] = static_cast<uint8_t>(v);
    return n;
}

}

size_t varint_size(int32_t v) {
    return encoded_size(static_cast<uint32_t>(v));
}

size_t varlong_size(int64_t v) {
    return encoded_size(static_cast<uint64_t>(v));
}

size_t write_varint(uint8_t* out, int32_t v) {
    return encode(out, static_cast<uint32_t>(v));
}

size_t write_varlong(uint8_t* out, int64_t v) {
    return encode(out, static_cast<uint64_t>(v));
}

}
