#pragma once

#include "craftwire/buffer/Multibytes.hpp"
#include "craftwire/memory/BlockAllocator.hpp"

#include <boost/asio/ip/tcp.hpp>

#include <cstdint>

namespace craftwire {

enum class ReadStatus : uint8_t {
    DATA = 0,
    END_OF_STREAM = 1
};

struct ReadResult {
    ReadStatus status = ReadStatus::END_OF_STREAM;
    Part data; // only set for DATA, truncated to what was read

    bool eof() const { return status == ReadStatus::END_OF_STREAM; }
};

// Blocking reads into pooled blocks. Errors other than a clean EOF throw
// boost::system::system_error.
class ConnectionSource {
public:
    explicit ConnectionSource(boost::asio::ip::tcp::socket& socket) : socket_(socket) {}

    ReadResult read(BlockAllocator& alloc);

private:
    boost::asio::ip::tcp::socket& socket_;
};

// Blocking gather writes.
class ConnectionSink {
public:
    explicit ConnectionSink(boost::asio::ip::tcp::socket& socket) : socket_(socket) {}

    // Returns bytes written, always bytes.size().
    size_t write(const Multibytes& bytes);

private:
    boost::asio::ip::tcp::socket& socket_;
};

}
