#pragma once

#include "craftwire/config/ConfigLoader.hpp"
#include "craftwire/memory/GlobalMemPool.hpp"
#include "craftwire/net/Connection.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace craftwire {

struct FramerSettings {
    size_t max_frame_size = 2097152;
    size_t max_packet_size = 8388608;
    size_t ring_capacity = 16;
};

struct CompressionSettings {
    int32_t threshold = -1; // negative: off
    int level = 6;
};

struct ServerSettings {
    std::string host = "127.0.0.1";
    uint16_t port = 25565;
};

struct Settings {
    MemPoolSettings mempool;
    FramerSettings framer;
    CompressionSettings compression;
    ServerSettings server;

    // Missing keys keep their defaults. Values out of range throw
    // std::invalid_argument naming the key.
    static Settings from(const ConfigLoader& cfg);

    ConnectionLimits limits() const;
};

}
