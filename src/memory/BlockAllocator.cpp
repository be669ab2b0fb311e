#include "craftwire/memory/BlockAllocator.hpp"

#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace craftwire {

Part::Part(BlockAllocator* owner, uint8_t* block, size_t len)
    : owner_(owner), block_(block), ptr_(block), len_(len) {}

Part::~Part() {
    release();
}

Part::Part(Part&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      block_(std::exchange(other.block_, nullptr)),
      ptr_(std::exchange(other.ptr_, nullptr)),
      len_(std::exchange(other.len_, 0)) {}

Part& Part::operator=(Part&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
        block_ = std::exchange(other.block_, nullptr);
        ptr_ = std::exchange(other.ptr_, nullptr);
        len_ = std::exchange(other.len_, 0);
    }
    return *this;
}

std::atomic<uint32_t>& Part::refcount() const {
    return *std::launder(reinterpret_cast<std::atomic<uint32_t>*>(
        block_ + owner_->usable_size()
    ));
}

void Part::release() noexcept {
    if (!owner_) return;

    if (refcount().fetch_sub(1, std::memory_order_acq_rel) == 1) {
        owner_->reclaim(block_);
    }

    owner_ = nullptr;
    block_ = nullptr;
    ptr_ = nullptr;
    len_ = 0;
}

void Part::advance(size_t n) {
    if (n > len_) {
        throw std::out_of_range(
            "advance " + std::to_string(n) + " past part of " + std::to_string(len_)
        );
    }
    ptr_ += n;
    len_ -= n;
}

void Part::truncate(size_t len) {
    if (len > len_) {
        throw std::out_of_range(
            "truncate to " + std::to_string(len) + " > len " + std::to_string(len_)
        );
    }
    len_ = len;
}

Part Part::split_to(size_t at) {
    if (at > len_) {
        throw std::out_of_range(
            "split_to " + std::to_string(at) + " past part of " + std::to_string(len_)
        );
    }
    if (!owner_) return Part();

    refcount().fetch_add(1, std::memory_order_relaxed);

    Part front(owner_, block_, at);
    front.ptr_ = ptr_;

    ptr_ += at;
    len_ -= at;
    return front;
}

uint32_t Part::use_count() const {
    if (!owner_) return 0;
    return refcount().load(std::memory_order_relaxed);
}

BlockAllocator::BlockAllocator(uint32_t buf_size) : buf_size_(buf_size) {
    if (buf_size < 3 || buf_size > 30) {
        throw std::invalid_argument(
            "buf_size must be within [3, 30], got " + std::to_string(buf_size)
        );
    }
}

Part BlockAllocator::adopt(uint8_t* block) {
    new (block + usable_size()) std::atomic<uint32_t>(1);
    return Part(this, block, usable_size());
}

}
