#pragma once

#include "craftwire/buffer/Multibytes.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace craftwire {

// One length-prefixed unit off the wire. packet still carries the length
// prefix; data_start points just past it.
struct Frame {
    Multibytes packet;
    Cursor data_start;
};

enum class FrameStatus : uint8_t {
    READY = 0,
    WAITING_FOR_HEADER = 1, // length prefix not complete yet, no size hint
    WAITING_FOR_DATA = 2,   // waiting_for holds the bytes still missing
    DECODE_ERROR = 3        // fatal, the peer sent garbage
};

const char* to_string(FrameStatus s);

struct FrameResult {
    FrameStatus status = FrameStatus::WAITING_FOR_HEADER;
    size_t waiting_for = 0;
    std::optional<Frame> frame;

    bool ready() const { return status == FrameStatus::READY; }
};

/*
 Splits a byte stream into varint length-prefixed frames.

 feed() appends whatever the socket produced; next() hands out complete
 frames one by one until it reports what it is waiting for. A header that
 was parsed before the body arrived is remembered across feeds.
 A decode error is sticky.
*/
class Framer {
public:
    explicit Framer(size_t max_frame_size);

    void feed(Part data);

    FrameResult next();

    // Visits every buffered byte that has not been framed yet, in order.
    void for_each_pending(const std::function<void(uint8_t*, size_t)>& fn);

    size_t max_frame_size() const { return max_frame_size_; }
    size_t buffered() const { return ring_.size(); }
    bool failed() const { return state_ == State::FAILED; }

private:
    enum class State : uint8_t {
        WAITING_FOR_HEADER,
        WAITING_FOR_TAILING_DATA,
        FAILED
    };

    FrameResult fail();
    FrameResult take(const Cursor& data_start, const Cursor& data_end);

    size_t max_frame_size_;
    Multibytes ring_;
    State state_ = State::WAITING_FOR_HEADER;

    // Valid in WAITING_FOR_TAILING_DATA.
    Cursor data_start_;
    Cursor data_end_;
};

}
