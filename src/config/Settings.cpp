#include "craftwire/config/Settings.hpp"

#include <limits>
#include <stdexcept>

namespace craftwire {

namespace {

long long ranged(const ConfigLoader& cfg, const char* section, const char* key,
                 long long def, long long lo, long long hi) {
    const long long v = cfg.getInt(section, key, def);
    if (v < lo || v > hi) {
        throw std::invalid_argument(
            std::string(section) + "." + key + " = " + std::to_string(v) +
            " outside [" + std::to_string(lo) + ", " + std::to_string(hi) + "]"
        );
    }
    return v;
}

}

Settings Settings::from(const ConfigLoader& cfg) {
    Settings s;
    constexpr long long kIntMax = std::numeric_limits<int32_t>::max();

    s.mempool.buf_size = static_cast<uint32_t>(
        ranged(cfg, "mempool", "buf_size", s.mempool.buf_size, 3, 30));
    s.mempool.page_entries = static_cast<size_t>(
        ranged(cfg, "mempool", "page_entries", s.mempool.page_entries, 1, kIntMax));
    s.mempool.concurrent_allocation_limit = static_cast<uint64_t>(
        ranged(cfg, "mempool", "concurrent_allocation_limit",
               s.mempool.concurrent_allocation_limit, 1, kIntMax));
    s.mempool.thread_cache = static_cast<size_t>(
        ranged(cfg, "mempool", "thread_cache", s.mempool.thread_cache,
               0, GlobalMemPool::kMaxThreadCache));

    s.framer.max_frame_size = static_cast<size_t>(
        ranged(cfg, "framer", "max_frame_size", s.framer.max_frame_size, 1, kIntMax));
    s.framer.max_packet_size = static_cast<size_t>(
        ranged(cfg, "framer", "max_packet_size", s.framer.max_packet_size, 1, kIntMax));
    s.framer.ring_capacity = static_cast<size_t>(
        ranged(cfg, "framer", "ring_capacity", s.framer.ring_capacity, 1, 1 << 20));

    s.compression.threshold = static_cast<int32_t>(
        ranged(cfg, "compression", "threshold", s.compression.threshold, -1, kIntMax));
    s.compression.level = static_cast<int>(
        ranged(cfg, "compression", "level", s.compression.level, -1, 9));

    s.server.host = cfg.get("server", "host", s.server.host);
    s.server.port = static_cast<uint16_t>(
        ranged(cfg, "server", "port", s.server.port, 0, 65535));
    return s;
}

ConnectionLimits Settings::limits() const {
    ConnectionLimits l;
    l.max_frame_size = framer.max_frame_size;
    l.max_packet_size = framer.max_packet_size;

    uint8_t bits = 1;
    while ((size_t(1) << bits) < framer.ring_capacity) ++bits;
    l.ring_bits = bits;
    return l;
}

}
