#pragma once

#include "craftwire/buffer/FragmentPool.hpp"
#include "craftwire/memory/BlockAllocator.hpp"

#include <boost/lockfree/queue.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace craftwire {

struct MemPoolSettings {
    uint32_t buf_size = 12;
    size_t page_entries = 64;
    uint64_t concurrent_allocation_limit = 1;
    size_t thread_cache = 64;
};

/*
 Block pool backed by anonymous mmap pages.

 Free blocks live in a per-thread stash first, then in a lock-free global
 queue. When both are empty a thread maps a new page of page_entries
 blocks, unless concurrent_allocation_limit threads are already doing so,
 in which case it backs off and polls the queue again.

 Pages are only returned to the OS when the pool is destroyed. Every Part
 must be gone by then.
*/
class GlobalMemPool : public BlockAllocator {
public:
    static constexpr size_t kMaxThreadCache = 64;

    explicit GlobalMemPool(const MemPoolSettings& settings);
    ~GlobalMemPool() override;

    Part allocate() override;

    size_t pages() const;

    // Number of pools the calling thread holds a block cache for.
    static size_t thread_cached_pools();
    const MemPoolSettings& settings() const { return settings_; }

protected:
    void reclaim(uint8_t* block) noexcept override;

private:
    using ThreadCache = FragmentPool<uint8_t*, kMaxThreadCache>;

    ThreadCache& thread_cache();
    uint8_t* allocate_global();
    uint8_t* map_page();

    MemPoolSettings settings_;
    uint64_t id_;

    boost::lockfree::queue<uint8_t*> memory_;
    std::atomic<uint64_t> allocs_{0};

    mutable std::mutex pages_mtx_;
    std::vector<void*> pages_;
};

}
