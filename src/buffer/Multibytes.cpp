#include "craftwire/buffer/Multibytes.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace craftwire {

// ---------------------------------------------------------------------------
// Cursor
// ---------------------------------------------------------------------------

bool Cursor::advance(const Multibytes& b, size_t n) {
    index += n;
    return true_up(b);
}

bool Cursor::true_up(const Multibytes& b) {
    for (;;) {
        if (page >= b.page_count()) {
            // Pointing at the start of the next, not yet received page is fine.
            return page == b.page_count() && index == 0;
        }

        const size_t len = b.page(page).size();
        if (index >= len) {
            index -= len;
            ++page;
        } else {
            return true;
        }
    }
}

size_t Cursor::remaining(const Multibytes& b) const {
    size_t total = 0;
    for (size_t p = page; p < b.page_count(); ++p) {
        total += b.page(p).size();
    }
    return total <= index ? 0 : total - index;
}

bool Cursor::has_atleast(const Multibytes& b, size_t len) const {
    size_t left = len + index;
    for (size_t p = page; p < b.page_count(); ++p) {
        const size_t bl = b.page(p).size();
        if (bl >= left) return true;
        left -= bl;
    }
    return left == 0;
}

size_t Cursor::bytes_vectored(
    const Multibytes& b,
    boost::asio::const_buffer* dst,
    size_t dst_len
) const {
    if (dst_len < 1 || page >= b.page_count()) return 0;

    const Part& first = b.page(page);
    const size_t skip = std::min(index, first.size());
    dst[0] = boost::asio::const_buffer(first.data() + skip, first.size() - skip);

    size_t n = 1;
    for (size_t p = page + 1; p < b.page_count() && n < dst_len; ++p) {
        const Part& item = b.page(p);
        if (item.empty()) continue;
        dst[n++] = boost::asio::const_buffer(item.data(), item.size());
    }
    return n;
}

size_t Cursor::run_off_end(const Multibytes& b) const {
    if (page >= b.page_count()) {
        // Past the last page everything counts as overrun.
        return index;
    }
    // Only the last page can be overrun by a trued-up cursor.
    const size_t len = b.page(page).size();
    return index > len ? index - len : 0;
}

// ---------------------------------------------------------------------------
// Multibytes
// ---------------------------------------------------------------------------

Multibytes Multibytes::copy_of(BlockAllocator& alloc, const uint8_t* data, size_t len) {
    Multibytes out;
    while (len > 0) {
        Part p = alloc.allocate();
        const size_t n = std::min(len, p.size());
        std::memcpy(p.data(), data, n);
        p.truncate(n);
        out.append(std::move(p));
        data += n;
        len -= n;
    }
    return out;
}

void Multibytes::append(Multibytes&& other) {
    for (auto& p : other.pages_) {
        pages_.push_back(std::move(p));
    }
    other.pages_.clear();
}

Multibytes Multibytes::partition_before(const Cursor& c) {
    if (c.page == 0 && c.index == 0) {
        return Multibytes();
    }

    if (c.page > pages_.size() || (c.page == pages_.size() && c.index != 0)) {
        throw std::out_of_range(
            "cursor {" + std::to_string(c.page) + ", " + std::to_string(c.index) +
            "} steps into a page which does not exist"
        );
    }

    std::deque<Part> front;
    for (size_t i = 0; i < c.page; ++i) {
        front.push_back(std::move(pages_.front()));
        pages_.pop_front();
    }

    if (c.index > 0) {
        front.push_back(pages_.front().split_to(c.index));
    }

    return Multibytes(std::move(front));
}

MultibytesView Multibytes::view() const {
    return MultibytesView(*this, cursor());
}

MultibytesView Multibytes::view_at(const Cursor& c) const {
    return MultibytesView(*this, c);
}

size_t Multibytes::size() const {
    size_t total = 0;
    for (const auto& p : pages_) {
        total += p.size();
    }
    return total;
}

std::vector<uint8_t> Multibytes::to_vector() const {
    std::vector<uint8_t> out;
    out.reserve(size());
    for (const auto& p : pages_) {
        out.insert(out.end(), p.data(), p.data() + p.size());
    }
    return out;
}

// ---------------------------------------------------------------------------
// MultibytesView
// ---------------------------------------------------------------------------

MultibytesView::MultibytesView(const Multibytes& b, Cursor c) : b_(&b), c_(c) {
    c_.true_up(*b_);
}

uint8_t MultibytesView::get_u8() {
    // A trued-up cursor with data left always points inside a page.
    if (c_.page >= b_->page_count() || !has_atleast(1)) {
        throw std::out_of_range("get_u8 past the end of the view");
    }
    const uint8_t v = b_->page(c_.page)[c_.index];
    c_.advance(*b_, 1);
    return v;
}

void MultibytesView::advance(size_t n) {
    if (!has_atleast(n)) {
        throw std::out_of_range("advance " + std::to_string(n) + " past the end of the view");
    }
    c_.advance(*b_, n);
}

void MultibytesView::copy_to(uint8_t* out, size_t n) {
    if (!has_atleast(n)) {
        throw std::out_of_range("copy of " + std::to_string(n) + " bytes past the end of the view");
    }
    while (n > 0) {
        auto [ptr, len] = chunk();
        const size_t take = std::min(n, len);
        std::memcpy(out, ptr, take);
        out += take;
        n -= take;
        c_.advance(*b_, take);
    }
}

std::pair<const uint8_t*, size_t> MultibytesView::chunk() const {
    if (c_.page >= b_->page_count()) return {nullptr, 0};
    const Part& p = b_->page(c_.page);
    if (c_.index >= p.size()) return {nullptr, 0};
    return {p.data() + c_.index, p.size() - c_.index};
}

// ---------------------------------------------------------------------------
// ByteCursor
// ---------------------------------------------------------------------------

uint8_t ByteCursor::get_u8() {
    if (n_ == 0) throw std::out_of_range("get_u8 past the end of the buffer");
    --n_;
    return *p_++;
}

void ByteCursor::advance(size_t n) {
    if (n > n_) {
        throw std::out_of_range("advance " + std::to_string(n) + " past the end of the buffer");
    }
    p_ += n;
    n_ -= n;
}

}
