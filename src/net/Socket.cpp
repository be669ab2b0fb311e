#include "craftwire/net/Socket.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <utility>
#include <vector>

namespace craftwire {

namespace asio = boost::asio;

ReadResult ConnectionSource::read(BlockAllocator& alloc) {
    Part block = alloc.allocate();

    boost::system::error_code ec;
    const size_t n = socket_.read_some(asio::buffer(block.data(), block.size()), ec);

    ReadResult r;
    if (ec == asio::error::eof) {
        r.status = ReadStatus::END_OF_STREAM;
        return r;
    }
    if (ec) throw boost::system::system_error(ec, "read_some");

    block.truncate(n);
    r.status = ReadStatus::DATA;
    r.data = std::move(block);
    return r;
}

size_t ConnectionSink::write(const Multibytes& bytes) {
    std::vector<asio::const_buffer> bufs(bytes.page_count());
    const size_t n = bytes.cursor().bytes_vectored(bytes, bufs.data(), bufs.size());
    bufs.resize(n);
    if (bufs.empty()) return 0;
    return asio::write(socket_, bufs);
}

}
