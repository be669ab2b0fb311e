#pragma once

#include <cstddef>
#include <cstdint>

namespace craftwire {

enum class ParseStatus : uint8_t {
    OK = 0,
    INCOMPLETE = 1,     // ran out of input, feed more and retry
    EXCEEDED_SHIFT = 2  // too many continuation bytes for the width
};

template<typename V>
struct ParseResult {
    ParseStatus status = ParseStatus::INCOMPLETE;
    V value = 0;
    uint32_t max_shift = 0;

    bool ok() const { return status == ParseStatus::OK; }
};

namespace detail {

template<typename U, typename S, uint32_t MaxShift, typename Input>
ParseResult<S> decode_varint(Input& in) {
    ParseResult<S> r;
    r.max_shift = MaxShift;

    U acc = 0;
    uint32_t shift = 0;
    for (;;) {
        if (!in.has_atleast(1)) {
            r.status = ParseStatus::INCOMPLETE;
            return r;
        }

        const uint8_t read = in.get_u8();
        acc |= static_cast<U>(read & 0x7f) << shift;
        if ((read & 0x80) == 0) {
            r.status = ParseStatus::OK;
            r.value = static_cast<S>(acc);
            return r;
        }

        shift += 7;
        if (shift > MaxShift) {
            r.status = ParseStatus::EXCEEDED_SHIFT;
            return r;
        }
    }
}

}

/*
 Varint decoders. Input is any cursor with has_atleast(n) and get_u8()
 (ByteCursor, MultibytesView). On OK the input sits right after the
 varint; otherwise its position is unspecified, so parse from a copy when
 the bytes must be re-read later.
*/
template<typename Input>
ParseResult<int32_t> varint(Input& in) {
    return detail::decode_varint<uint32_t, int32_t, 32>(in);
}

template<typename Input>
ParseResult<int64_t> varlong(Input& in) {
    return detail::decode_varint<uint64_t, int64_t, 64>(in);
}

constexpr size_t kMaxVarintSize = 5;
constexpr size_t kMaxVarlongSize = 10;

size_t varint_size(int32_t v);
size_t varlong_size(int64_t v);

// Writes the encoding into out (at least kMaxVarintSize / kMaxVarlongSize
// bytes) and returns the number of bytes written.
size_t write_varint(uint8_t* out, int32_t v);
size_t write_varlong(uint8_t* out, int64_t v);

}
