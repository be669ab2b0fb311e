#include "craftwire/protocol/Framer.hpp"
#include "craftwire/protocol/Varint.hpp"

#include <iostream>
#include <utility>

namespace craftwire {

const char* to_string(FrameStatus s) {
    switch (s) {
        case FrameStatus::READY:              return "READY";
        case FrameStatus::WAITING_FOR_HEADER: return "WAITING_FOR_HEADER";
        case FrameStatus::WAITING_FOR_DATA:   return "WAITING_FOR_DATA";
        case FrameStatus::DECODE_ERROR:       return "DECODE_ERROR";
    }
    return "UNKNOWN";
}

Framer::Framer(size_t max_frame_size) : max_frame_size_(max_frame_size) {}

void Framer::feed(Part data) {
    ring_.append(std::move(data));
}

FrameResult Framer::fail() {
    state_ = State::FAILED;
    FrameResult r;
    r.status = FrameStatus::DECODE_ERROR;
    return r;
}

FrameResult Framer::take(const Cursor& data_start, const Cursor& data_end) {
    FrameResult r;
    r.status = FrameStatus::READY;
    // data_start stays valid: the frame is cut from the front of the ring
    // and data_start < data_end.
    r.frame = Frame{ring_.partition_before(data_end), data_start};
    return r;
}

FrameResult Framer::next() {
    switch (state_) {
        case State::FAILED:
            return fail();

        case State::WAITING_FOR_HEADER: {
            MultibytesView header = ring_.view();
            ParseResult<int32_t> len = varint(header);

            if (len.status == ParseStatus::INCOMPLETE) {
                FrameResult r;
                r.status = FrameStatus::WAITING_FOR_HEADER;
                return r;
            }

            if (len.status == ParseStatus::EXCEEDED_SHIFT) {
                std::cerr << "[FRAMER] length prefix overran " << len.max_shift << " bits\n";
                return fail();
            }

            if (len.value < 0 || static_cast<size_t>(len.value) > max_frame_size_) {
                std::cerr << "[FRAMER] frame length " << len.value
                          << " outside [0, " << max_frame_size_ << "]\n";
                return fail();
            }

            const Cursor data_start = header.cursor();
            Cursor data_end = data_start;
            if (data_end.advance(ring_, static_cast<size_t>(len.value))) {
                return take(data_start, data_end);
            }

            data_start_ = data_start;
            data_end_ = data_end;
            state_ = State::WAITING_FOR_TAILING_DATA;

            FrameResult r;
            r.status = FrameStatus::WAITING_FOR_DATA;
            r.waiting_for = data_end.run_off_end(ring_);
            return r;
        }

        case State::WAITING_FOR_TAILING_DATA: {
            if (data_end_.true_up(ring_)) {
                state_ = State::WAITING_FOR_HEADER;
                return take(data_start_, data_end_);
            }

            FrameResult r;
            r.status = FrameStatus::WAITING_FOR_DATA;
            r.waiting_for = data_end_.run_off_end(ring_);
            return r;
        }
    }
    return fail();
}

void Framer::for_each_pending(const std::function<void(uint8_t*, size_t)>& fn) {
    for (auto& page : ring_.pages()) {
        if (!page.empty()) fn(page.data(), page.size());
    }
}

}
