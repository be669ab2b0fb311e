#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace craftwire {

/*
 Growable power-of-two ring holding runs ("frames") of T back to back.

 Every frame starts with a header slot pointing at the slot after its last
 element. Frames are written one at a time at the head and may be released
 in any order:
   - releasing the frame at the head rolls the head back over it,
   - releasing the frame at the base moves the base past every already
     released frame behind it,
   - anything else only marks the frame dead until the base catches up.

 Positions are absolute and only masked on access, so handles survive the
 ring doubling underneath them. Handles must be released before the ring.
*/
template<typename T>
class FramedRing {
    struct Header {
        size_t next;
        bool live;
    };

    union Slot {
        Header header;
        T element;

        Slot() {}
        ~Slot() {}
    };

public:
    class Writer;

    class Reader {
    public:
        class const_iterator {
        public:
            const_iterator(const FramedRing* ring, size_t pos) : ring_(ring), pos_(pos) {}

            const T& operator*() const { return ring_->at(pos_).element; }
            const T* operator->() const { return &ring_->at(pos_).element; }

            const_iterator& operator++() {
                ++pos_;
                return *this;
            }

            bool operator==(const const_iterator& o) const { return pos_ == o.pos_; }
            bool operator!=(const const_iterator& o) const { return pos_ != o.pos_; }

        private:
            const FramedRing* ring_;
            size_t pos_;
        };

        Reader() = default;

        ~Reader() {
            reset();
        }

        Reader(const Reader&) = delete;
        Reader& operator=(const Reader&) = delete;

        Reader(Reader&& o) noexcept
            : ring_(std::exchange(o.ring_, nullptr)), start_(o.start_) {}

        Reader& operator=(Reader&& o) noexcept {
            if (this != &o) {
                reset();
                ring_ = std::exchange(o.ring_, nullptr);
                start_ = o.start_;
            }
            return *this;
        }

        bool valid() const { return ring_ != nullptr; }

        size_t size() const {
            if (!ring_) return 0;
            return ring_->at(start_).header.next - start_ - 1;
        }

        bool empty() const { return size() == 0; }

        const T* get(size_t index) const {
            if (!ring_ || index >= size()) return nullptr;
            return &ring_->at(start_ + 1 + index).element;
        }

        const T& operator[](size_t index) const {
            return ring_->at(start_ + 1 + index).element;
        }

        T& mutable_at(size_t index) {
            if (!ring_ || index >= size()) throw std::out_of_range("frame index out of range");
            return ring_->at(start_ + 1 + index).element;
        }

        const_iterator begin() const {
            return const_iterator(ring_, start_ + 1);
        }

        const_iterator end() const {
            return const_iterator(ring_, ring_ ? ring_->at(start_).header.next : start_ + 1);
        }

        // Moves every element out and releases the frame.
        std::vector<T> take() {
            std::vector<T> out;
            if (!ring_) return out;

            const size_t end_pos = ring_->at(start_).header.next;
            out.reserve(end_pos - start_ - 1);
            for (size_t p = start_ + 1; p < end_pos; ++p) {
                out.push_back(std::move(ring_->at(p).element));
            }
            reset();
            return out;
        }

        void reset() noexcept {
            if (ring_) {
                ring_->release(start_);
                ring_ = nullptr;
            }
        }

    private:
        friend class FramedRing;
        friend class Writer;

        Reader(FramedRing* ring, size_t start) : ring_(ring), start_(start) {}

        FramedRing* ring_ = nullptr;
        size_t start_ = 0;
    };

    class Writer {
    public:
        Writer(Writer&&) noexcept = default;
        Writer& operator=(Writer&&) noexcept = default;

        // Only valid while this frame is the newest one in the ring.
        void append(T element) {
            FramedRing* ring = f_.ring_;
            if (!ring) throw std::logic_error("append to a released frame");
            if (ring->at(f_.start_).header.next != ring->head_) {
                throw std::logic_error("append to a frame that is no longer at the head");
            }

            ring->make_room();
            new (&ring->at(ring->head_).element) T(std::move(element));
            ++ring->head_;
            ++ring->at(f_.start_).header.next;
        }

        // Seals this frame and keeps writing into a fresh one.
        Reader next() {
            FramedRing* ring = f_.ring_;
            if (!ring) throw std::logic_error("next on a released frame");

            const size_t fresh = ring->push_header();
            Reader sealed = std::move(f_);
            f_ = Reader(ring, fresh);
            return sealed;
        }

        const Reader& reader() const { return f_; }
        size_t size() const { return f_.size(); }

        // Gives up the write side and keeps the frame readable.
        Reader seal() { return std::move(f_); }

    private:
        friend class FramedRing;

        explicit Writer(Reader f) : f_(std::move(f)) {}

        Reader f_;
    };

    explicit FramedRing(uint8_t initial_bits = 4)
        : bits_(initial_bits),
          ring_(new Slot[size_t(1) << initial_bits]) {}

    ~FramedRing() {
        size_t pos = base_;
        while (pos < head_) {
            const Header h = at(pos).header;
            if (h.live) {
                for (size_t p = pos + 1; p < h.next; ++p) {
                    at(p).element.~T();
                }
            }
            pos = h.next;
        }
    }

    FramedRing(const FramedRing&) = delete;
    FramedRing& operator=(const FramedRing&) = delete;

    Writer frame() {
        return Writer(Reader(this, push_header()));
    }

    // Hands the write side back if nothing was framed after this frame.
    std::optional<Writer> try_promote(Reader&& frame) {
        if (frame.ring_ != this) return std::nullopt;
        if (at(frame.start_).header.next != head_) return std::nullopt;
        return Writer(std::move(frame));
    }

    Writer promote(Reader&& frame) {
        auto w = try_promote(std::move(frame));
        if (!w) throw std::logic_error("frame is not at the head of the ring");
        return std::move(*w);
    }

    size_t capacity() const { return size_t(1) << bits_; }
    size_t used() const { return head_ - base_; }
    bool empty() const { return head_ == base_; }

private:
    size_t mask() const { return capacity() - 1; }

    Slot& at(size_t pos) { return ring_[pos & mask()]; }
    const Slot& at(size_t pos) const { return ring_[pos & mask()]; }

    size_t push_header() {
        make_room();
        const size_t start = head_;
        new (&at(start).header) Header{start + 1, true};
        ++head_;
        return start;
    }

    void make_room() {
        if (head_ - base_ < capacity()) return;

        const uint8_t new_bits = bits_ + 1;
        const size_t new_mask = (size_t(1) << new_bits) - 1;
        std::unique_ptr<Slot[]> fresh(new Slot[size_t(1) << new_bits]);

        size_t pos = base_;
        while (pos < head_) {
            const Header h = at(pos).header;
            new (&fresh[pos & new_mask].header) Header(h);
            if (h.live) {
                for (size_t p = pos + 1; p < h.next; ++p) {
                    T& old = at(p).element;
                    new (&fresh[p & new_mask].element) T(std::move(old));
                    old.~T();
                }
            }
            pos = h.next;
        }

        ring_ = std::move(fresh);
        bits_ = new_bits;
    }

    void release(size_t start) noexcept {
        Header& h = at(start).header;
        for (size_t p = start + 1; p < h.next; ++p) {
            at(p).element.~T();
        }

        if (h.next == head_) {
            head_ = start;
            return;
        }

        if (start == base_) {
            size_t pos = h.next;
            while (pos < head_ && !at(pos).header.live) {
                pos = at(pos).header.next;
            }
            base_ = pos < head_ ? pos : head_;
            return;
        }

        h.live = false;
    }

    uint8_t bits_;
    std::unique_ptr<Slot[]> ring_;
    size_t base_ = 0;
    size_t head_ = 0;
};

}
