#pragma once

#include "craftwire/buffer/Multibytes.hpp"
#include "craftwire/compress/Zlib.hpp"
#include "craftwire/memory/BlockAllocator.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace craftwire {

/*
 Runs a zlib operator over a Multibytes and collects the output in blocks
 taken from the allocator.

 Every input page is pushed with NO_FLUSH, then the stream is drained with
 the requested flush mode. A stream that reaches Z_STREAM_END is reset so
 the next process() call starts a fresh one; so is a FINISH call that ran
 out of input. Input after the end of a stream is ignored.
*/
template <typename Op>
class ZlibPipe {
public:
    template <typename... Args>
    explicit ZlibPipe(BlockAllocator& alloc, Args&&... args)
        : alloc_(alloc), op_(std::forward<Args>(args)...) {}

    ZlibPipe(const ZlibPipe&) = delete;
    ZlibPipe& operator=(const ZlibPipe&) = delete;

    Multibytes process(
        const Multibytes& in,
        FlushMode flush,
        size_t max_output = std::numeric_limits<size_t>::max()
    ) {
        return process(in.view(), flush, max_output);
    }

    Multibytes process(
        MultibytesView in,
        FlushMode flush,
        size_t max_output = std::numeric_limits<size_t>::max()
    ) {
        Run run(*this, max_output);
        z_stream& s = op_.strm();

        while (!run.ended && in.remaining() > 0) {
            const auto chunk = in.chunk();
            s.next_in = const_cast<Bytef*>(chunk.first);
            s.avail_in = static_cast<uInt>(chunk.second);

            while (s.avail_in > 0) {
                const int rc = run.step(FlushMode::NO_FLUSH);
                if (rc == Z_STREAM_END) {
                    run.ended = true;
                    break;
                }
                if (rc == Z_BUF_ERROR) break;
            }

            in.advance(chunk.second - s.avail_in);
            if (!run.ended && s.avail_in > 0) break;
        }
        s.next_in = nullptr;
        s.avail_in = 0;

        while (!run.ended) {
            const int rc = run.step(flush);
            if (rc == Z_STREAM_END) {
                run.ended = true;
                break;
            }
            if (rc == Z_BUF_ERROR || s.avail_out != 0) break;
        }

        if (run.ended || flush == FlushMode::FINISH) op_.reset();
        return run.finish();
    }

    void reset() { op_.reset(); }

    Op& op() { return op_; }

private:
    // Output side of one process() call.
    struct Run {
        Run(ZlibPipe& p, size_t max) : pipe(p), max_output(max) {}

        ~Run() {
            z_stream& s = pipe.op_.strm();
            s.next_out = nullptr;
            s.avail_out = 0;
        }

        int step(FlushMode flush) {
            z_stream& s = pipe.op_.strm();
            if (!cur.valid() || s.avail_out == 0) rotate();

            const int rc = pipe.op_.process(flush);
            if (produced() > max_output) {
                pipe.op_.reset();
                throw ZlibError(
                    Z_OK,
                    "zlib output exceeds " + std::to_string(max_output) + " bytes"
                );
            }
            return rc;
        }

        void rotate() {
            if (cur.valid()) {
                full += cur.size();
                out.append(std::move(cur));
            }
            cur = pipe.alloc_.allocate();
            z_stream& s = pipe.op_.strm();
            s.next_out = cur.data();
            s.avail_out = static_cast<uInt>(cur.size());
        }

        size_t produced() const {
            if (!cur.valid()) return full;
            return full + cur.size() - pipe.op_.strm().avail_out;
        }

        Multibytes finish() {
            if (cur.valid()) {
                const size_t used = cur.size() - pipe.op_.strm().avail_out;
                if (used > 0) {
                    cur.truncate(used);
                    out.append(std::move(cur));
                } else {
                    cur = Part();
                }
            }
            return std::move(out);
        }

        ZlibPipe& pipe;
        size_t max_output;
        size_t full = 0;
        bool ended = false;
        Part cur;
        Multibytes out;
    };

    BlockAllocator& alloc_;
    Op op_;
};

using Inflater = ZlibPipe<Inflate>;
using Deflater = ZlibPipe<Deflate>;

}
