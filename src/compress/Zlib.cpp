#include "craftwire/compress/Zlib.hpp"

namespace craftwire {

namespace {

// Z_BUF_ERROR only means no progress was possible; the caller decides.
int check(z_stream& strm, int rc, const char* op) {
    if (rc >= 0 || rc == Z_BUF_ERROR) return rc;

    std::string msg = std::string(op) + ": " + zlib_code_name(rc);
    if (strm.msg) {
        msg += " (";
        msg += strm.msg;
        msg += ")";
    }
    throw ZlibError(rc, msg);
}

}

ZlibError::ZlibError(int code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

const char* zlib_code_name(int code) {
    switch (code) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
    }
    return "Z_UNKNOWN";
}

Inflate::Inflate() {
    check(strm_, ::inflateInit(&strm_), "inflateInit");
}

Inflate::~Inflate() {
    ::inflateEnd(&strm_);
}

int Inflate::process(FlushMode flush) {
    const int rc = ::inflate(&strm_, static_cast<int>(flush));
    if (rc == Z_NEED_DICT) {
        throw ZlibError(rc, "inflate: preset dictionary requested");
    }
    return check(strm_, rc, "inflate");
}

void Inflate::reset() {
    check(strm_, ::inflateReset(&strm_), "inflateReset");
}

Deflate::Deflate(int level) {
    check(strm_, ::deflateInit(&strm_, level), "deflateInit");
}

Deflate::~Deflate() {
    ::deflateEnd(&strm_);
}

int Deflate::process(FlushMode flush) {
    return check(strm_, ::deflate(&strm_, static_cast<int>(flush)), "deflate");
}

void Deflate::reset() {
    check(strm_, ::deflateReset(&strm_), "deflateReset");
}

}
