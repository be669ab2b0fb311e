#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace craftwire {

class BlockAllocator;

/*
 Move-only view into a pooled block.
 The last 4 bytes of every block hold the number of Parts still pointing
 into it; the block goes back to its allocator when that count hits zero.
*/
class Part {
public:
    Part() = default;
    ~Part();

    Part(const Part&) = delete;
    Part& operator=(const Part&) = delete;

    Part(Part&& other) noexcept;
    Part& operator=(Part&& other) noexcept;

    uint8_t* data() { return ptr_; }
    const uint8_t* data() const { return ptr_; }
    size_t size() const { return len_; }
    bool empty() const { return len_ == 0; }
    bool valid() const { return owner_ != nullptr; }

    uint8_t& operator[](size_t i) { return ptr_[i]; }
    const uint8_t& operator[](size_t i) const { return ptr_[i]; }

    // Drops n bytes from the front.
    void advance(size_t n);

    void truncate(size_t len);

    // Returns [0, at) as a new Part sharing the block; this keeps [at, size).
    Part split_to(size_t at);

    // Number of Parts referencing the same block (diagnostics only).
    uint32_t use_count() const;

private:
    friend class BlockAllocator;

    Part(BlockAllocator* owner, uint8_t* block, size_t len);

    std::atomic<uint32_t>& refcount() const;
    void release() noexcept;

    BlockAllocator* owner_ = nullptr;
    uint8_t* block_ = nullptr;
    uint8_t* ptr_ = nullptr;
    size_t len_ = 0;
};

class BlockAllocator {
public:
    // Blocks are (1 << buf_size) bytes.
    explicit BlockAllocator(uint32_t buf_size);
    virtual ~BlockAllocator() = default;

    BlockAllocator(const BlockAllocator&) = delete;
    BlockAllocator& operator=(const BlockAllocator&) = delete;

    virtual Part allocate() = 0;

    uint32_t buf_size() const { return buf_size_; }
    size_t block_size() const { return size_t(1) << buf_size_; }
    size_t usable_size() const { return block_size() - sizeof(uint32_t); }

protected:
    // Stamps a refcount of one into the block tail and wraps it.
    Part adopt(uint8_t* block);

    virtual void reclaim(uint8_t* block) noexcept = 0;

private:
    friend class Part;

    uint32_t buf_size_;
};

}
