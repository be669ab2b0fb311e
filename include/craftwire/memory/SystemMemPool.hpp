#pragma once

#include "craftwire/memory/BlockAllocator.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace craftwire {

/*
 Heap-backed allocator with the same block layout as GlobalMemPool.
 One new[] per allocate, one delete[] per reclaim. Meant for tests and
 low-volume tools.
*/
class SystemMemPool : public BlockAllocator {
public:
    explicit SystemMemPool(uint32_t buf_size = 12);
    ~SystemMemPool() override = default;

    Part allocate() override;

    // Blocks handed out and not yet reclaimed.
    size_t outstanding() const { return outstanding_.load(std::memory_order_acquire); }

protected:
    void reclaim(uint8_t* block) noexcept override;

private:
    std::atomic<size_t> outstanding_{0};
};

}
