#pragma once

#include "craftwire/memory/BlockAllocator.hpp"

#include <boost/asio/buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

namespace craftwire {

class Multibytes;
class MultibytesView;

/*
 Position inside a Multibytes: page number plus offset into that page.

 A cursor is "trued up" when index < page length, or when it sits at
 {page_count, 0}, the start of the page that has not arrived yet.
 advance() may leave it past the end; appending pages and calling
 true_up() again brings it back.
*/
struct Cursor {
    size_t page = 0;
    size_t index = 0;

    bool advance(const Multibytes& b, size_t n);
    bool true_up(const Multibytes& b);

    size_t remaining(const Multibytes& b) const;
    bool has_atleast(const Multibytes& b, size_t len) const;

    // Fills dst with the bytes from this cursor on, one entry per page
    // (empty pages after the first are skipped). Returns entries written.
    size_t bytes_vectored(
        const Multibytes& b,
        boost::asio::const_buffer* dst,
        size_t dst_len
    ) const;

    // How many bytes past the end of the data this cursor points.
    size_t run_off_end(const Multibytes& b) const;

    bool operator==(const Cursor& o) const { return page == o.page && index == o.index; }
    bool operator!=(const Cursor& o) const { return !(*this == o); }
};

class Multibytes {
public:
    Multibytes() = default;
    explicit Multibytes(std::deque<Part> pages) : pages_(std::move(pages)) {}

    Multibytes(const Multibytes&) = delete;
    Multibytes& operator=(const Multibytes&) = delete;
    Multibytes(Multibytes&&) = default;
    Multibytes& operator=(Multibytes&&) = default;

    // Copies len bytes into as many blocks as it takes.
    static Multibytes copy_of(BlockAllocator& alloc, const uint8_t* data, size_t len);

    Cursor cursor() const { return Cursor{}; }

    void append(Part p) { pages_.push_back(std::move(p)); }
    void append(Multibytes&& other);

    // Splits off everything before a trued-up cursor and returns it. A page
    // straddling the cursor is split in two.
    Multibytes partition_before(const Cursor& c);

    MultibytesView view() const;
    MultibytesView view_at(const Cursor& c) const;

    size_t page_count() const { return pages_.size(); }
    const Part& page(size_t i) const { return pages_[i]; }
    Part& page(size_t i) { return pages_[i]; }

    std::deque<Part>& pages() { return pages_; }
    const std::deque<Part>& pages() const { return pages_; }

    // Total bytes across all pages.
    size_t size() const;
    bool empty() const { return size() == 0; }

    std::vector<uint8_t> to_vector() const;

private:
    std::deque<Part> pages_;
};

/*
 Read cursor over a Multibytes. The Multibytes must outlive the view and
 must not lose pages while the view is in use (appending is fine).
*/
class MultibytesView {
public:
    MultibytesView(const Multibytes& b, Cursor c);

    size_t remaining() const { return c_.remaining(*b_); }
    bool has_atleast(size_t len) const { return c_.has_atleast(*b_, len); }

    uint8_t get_u8();
    void advance(size_t n);
    void copy_to(uint8_t* out, size_t n);

    // Contiguous bytes at the cursor, up to the end of the current page.
    std::pair<const uint8_t*, size_t> chunk() const;

    Cursor cursor() const { return c_; }
    const Multibytes& source() const { return *b_; }

private:
    const Multibytes* b_;
    Cursor c_;
};

/*
 The same read surface over one contiguous span.
*/
class ByteCursor {
public:
    ByteCursor(const uint8_t* data, size_t len) : p_(data), n_(len) {}

    size_t remaining() const { return n_; }
    bool has_atleast(size_t len) const { return n_ >= len; }

    uint8_t get_u8();
    void advance(size_t n);

    const uint8_t* data() const { return p_; }

private:
    const uint8_t* p_;
    size_t n_;
};

}
