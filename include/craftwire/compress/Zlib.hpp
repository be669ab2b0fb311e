#pragma once

#include <zlib.h>

#include <stdexcept>
#include <string>

namespace craftwire {

enum class FlushMode : int {
    NO_FLUSH = Z_NO_FLUSH,
    PARTIAL_FLUSH = Z_PARTIAL_FLUSH,
    SYNC_FLUSH = Z_SYNC_FLUSH,
    FULL_FLUSH = Z_FULL_FLUSH,
    FINISH = Z_FINISH,
    BLOCK = Z_BLOCK,
    TREES = Z_TREES
};

class ZlibError : public std::runtime_error {
public:
    ZlibError(int code, const std::string& what);

    // Z_ERRNO .. Z_VERSION_ERROR, or Z_OK for limits we impose ourselves.
    int code() const { return code_; }

private:
    int code_;
};

const char* zlib_code_name(int code);

/*
 RAII z_stream wrappers. process() returns the raw zlib code so callers
 can tell Z_STREAM_END and Z_BUF_ERROR apart from real failures, which are
 thrown.
*/
class Inflate {
public:
    Inflate();
    ~Inflate();

    Inflate(const Inflate&) = delete;
    Inflate& operator=(const Inflate&) = delete;

    int process(FlushMode flush);
    void reset();

    z_stream& strm() { return strm_; }
    const z_stream& strm() const { return strm_; }

private:
    z_stream strm_{};
};

class Deflate {
public:
    explicit Deflate(int level);
    ~Deflate();

    Deflate(const Deflate&) = delete;
    Deflate& operator=(const Deflate&) = delete;

    int process(FlushMode flush);
    void reset();

    z_stream& strm() { return strm_; }
    const z_stream& strm() const { return strm_; }

private:
    z_stream strm_{};
};

}
