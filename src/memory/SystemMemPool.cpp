#include "craftwire/memory/SystemMemPool.hpp"

namespace craftwire {

SystemMemPool::SystemMemPool(uint32_t buf_size) : BlockAllocator(buf_size) {}

Part SystemMemPool::allocate() {
    uint8_t* block = new uint8_t[block_size()];
    outstanding_.fetch_add(1, std::memory_order_relaxed);
    return adopt(block);
}

void SystemMemPool::reclaim(uint8_t* block) noexcept {
    delete[] block;
    outstanding_.fetch_sub(1, std::memory_order_release);
}

}
