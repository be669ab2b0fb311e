// =============================================================================
// craftwire_dump.cpp - packet dump for one inbound connection
// =============================================================================
// Usage: craftwire_dump [config.ini]
// Listens on [server] host/port, accepts one peer and prints the id and size
// of every packet until the peer hangs up or SIGINT/SIGTERM.
// =============================================================================
#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <thread>

#include <sys/socket.h>

#include <boost/asio.hpp>

#include "craftwire/config/ConfigLoader.hpp"
#include "craftwire/config/Settings.hpp"
#include "craftwire/memory/GlobalMemPool.hpp"
#include "craftwire/net/Connection.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

std::atomic<bool> g_running{true};
std::atomic<int> g_peer_fd{-1};

void signalHandler(int sig) {
    std::cout << "\nReceived signal " << sig << ", shutting down...\n";
    g_running = false;

    // Unblocks a pending read; it then reports EOF.
    const int fd = g_peer_fd.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

int main(int argc, char** argv) {
    std::cout << "=========================================================\n";
    std::cout << "  CRAFTWIRE - packet dump\n";
    std::cout << "=========================================================\n\n";

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    craftwire::ConfigLoader& cfg = craftwire::ConfigLoader::instance();
    if (!cfg.load(argc > 1 ? argv[1] : "config.ini")) {
        std::cout << "[DUMP] No config file, running with defaults\n";
    } else {
        cfg.dump();
    }

    try {
        const craftwire::Settings settings = craftwire::Settings::from(cfg);
        craftwire::GlobalMemPool pool(settings.mempool);

        asio::io_context ioc;
        tcp::acceptor acceptor(
            ioc, tcp::endpoint(asio::ip::make_address(settings.server.host), settings.server.port));
        acceptor.non_blocking(true);

        std::cout << "[DUMP] Listening on " << settings.server.host << ":"
                  << settings.server.port << "\n";

        tcp::socket socket(ioc);
        while (g_running.load()) {
            boost::system::error_code ec;
            acceptor.accept(socket, ec);

            if (ec == asio::error::would_block || ec == asio::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (ec) throw boost::system::system_error(ec, "accept");
            break;
        }
        if (!g_running.load()) return 0;

        socket.non_blocking(false);
        std::cout << "[DUMP] Peer " << socket.remote_endpoint() << " connected\n";

        craftwire::Connection conn(std::move(socket), pool, settings.limits());
        if (settings.compression.threshold >= 0) {
            conn.start_compression(settings.compression.threshold, settings.compression.level);
        }
        g_peer_fd = conn.socket().native_handle();

        uint64_t total = 0;
        while (g_running.load()) {
            auto batch = conn.read_batch();
            if (!batch) break;

            for (const craftwire::Packet& p : *batch) {
                const auto id = p.packet_id();
                std::cout << "[DUMP] #" << total++ << " id=";
                if (id) {
                    std::cout << "0x" << std::hex << *id << std::dec;
                } else {
                    std::cout << "?";
                }
                std::cout << " size=" << p.body_size()
                          << (p.compressed() ? " (compressed)" : "") << "\n";
            }
        }

        g_peer_fd = -1;
        std::cout << "[DUMP] " << total << " packets, " << pool.pages()
                  << " pool pages mapped\n";
    } catch (const std::exception& e) {
        g_peer_fd = -1;
        std::cerr << "[DUMP] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
