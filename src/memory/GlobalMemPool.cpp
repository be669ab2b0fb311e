#include "craftwire/memory/GlobalMemPool.hpp"

#include <sys/mman.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace craftwire {

namespace {

std::atomic<uint64_t> g_next_pool_id{1};

// Thread caches are keyed by pool id so a cache never outlives the meaning
// of its pointers: ids are never reused.
thread_local std::unordered_map<
    uint64_t,
    FragmentPool<uint8_t*, GlobalMemPool::kMaxThreadCache>
> t_caches;

std::mutex g_live_mtx;
std::unordered_set<uint64_t> g_live_ids;

// Drops this thread's caches of pools destroyed elsewhere.
void sweep_dead_caches() {
    std::lock_guard<std::mutex> lock(g_live_mtx);
    for (auto it = t_caches.begin(); it != t_caches.end();) {
        if (g_live_ids.count(it->first) == 0) {
            it = t_caches.erase(it);
        } else {
            ++it;
        }
    }
}

void backoff(unsigned step) {
    if (step < 6) {
        for (unsigned i = 0; i < (1u << step); ++i) {
            std::atomic_signal_fence(std::memory_order_seq_cst);
        }
    } else {
        std::this_thread::yield();
    }
}

}

GlobalMemPool::GlobalMemPool(const MemPoolSettings& settings)
    : BlockAllocator(settings.buf_size),
      settings_(settings),
      id_(g_next_pool_id.fetch_add(1, std::memory_order_relaxed)),
      memory_(settings.page_entries) {
    if (settings.page_entries == 0) {
        throw std::invalid_argument("page_entries must be > 0");
    }
    if (settings.concurrent_allocation_limit == 0) {
        throw std::invalid_argument("concurrent_allocation_limit must be > 0");
    }

    std::lock_guard<std::mutex> lock(g_live_mtx);
    g_live_ids.insert(id_);
}

GlobalMemPool::~GlobalMemPool() {
    {
        std::lock_guard<std::mutex> lock(g_live_mtx);
        g_live_ids.erase(id_);
    }
    t_caches.erase(id_);

    std::lock_guard<std::mutex> lock(pages_mtx_);
    const size_t page_bytes = settings_.page_entries << settings_.buf_size;
    for (void* page : pages_) {
        if (::munmap(page, page_bytes) != 0) {
            std::cerr << "[MEMPOOL] munmap failed: " << std::strerror(errno) << "\n";
        }
    }
}

size_t GlobalMemPool::pages() const {
    std::lock_guard<std::mutex> lock(pages_mtx_);
    return pages_.size();
}

GlobalMemPool::ThreadCache& GlobalMemPool::thread_cache() {
    auto it = t_caches.find(id_);
    if (it == t_caches.end()) {
        sweep_dead_caches();
        it = t_caches.try_emplace(id_, settings_.thread_cache).first;
    }
    return it->second;
}

size_t GlobalMemPool::thread_cached_pools() {
    return t_caches.size();
}

Part GlobalMemPool::allocate() {
    auto cached = thread_cache().maybe_pop();
    uint8_t* block = cached ? *cached : allocate_global();
    return adopt(block);
}

// Never creates a thread cache: a thread that only frees hands its blocks
// straight to the global queue.
void GlobalMemPool::reclaim(uint8_t* block) noexcept {
    auto it = t_caches.find(id_);
    if (it != t_caches.end() && it->second.try_push(std::move(block))) return;

    // Queue nodes are reserved page by page, so this only fails when the
    // process is out of memory.
    if (!memory_.push(block)) {
        std::cerr << "[MEMPOOL] free queue exhausted, block leaked\n";
    }
}

uint8_t* GlobalMemPool::map_page() {
    const size_t page_bytes = settings_.page_entries << settings_.buf_size;

    void* page = ::mmap(
        nullptr,
        page_bytes,
        PROT_READ | PROT_WRITE,
        MAP_PRIVATE | MAP_ANONYMOUS,
        -1,
        0
    );

    if (page == MAP_FAILED) {
        throw std::runtime_error(
            std::string("[MEMPOOL] mmap of ") + std::to_string(page_bytes) +
            " bytes failed: " + std::strerror(errno)
        );
    }

    std::lock_guard<std::mutex> lock(pages_mtx_);
    pages_.push_back(page);
    return static_cast<uint8_t*>(page);
}

uint8_t* GlobalMemPool::allocate_global() {
    struct AllocSlot {
        std::atomic<uint64_t>& allocs;
        ~AllocSlot() { allocs.fetch_sub(1, std::memory_order_release); }
    };

    unsigned step = 0;
    for (;;) {
        uint8_t* block = nullptr;
        if (memory_.pop(block)) return block;

        {
            const uint64_t previous = allocs_.fetch_add(1, std::memory_order_acq_rel);
            AllocSlot slot{allocs_};

            if (previous < settings_.concurrent_allocation_limit) {
                uint8_t* base = map_page();
                memory_.reserve(settings_.page_entries);

                // Block 0 goes straight to the caller.
                for (size_t i = 1; i < settings_.page_entries; ++i) {
                    if (!memory_.push(base + (i << settings_.buf_size))) {
                        throw std::runtime_error("[MEMPOOL] free queue push failed");
                    }
                }
                return base;
            }
        }

        // Someone else is mapping; their blocks should show up shortly.
        backoff(step++);
    }
}

}
