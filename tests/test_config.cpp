#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>

#include "craftwire/config/ConfigLoader.hpp"
#include "craftwire/config/Settings.hpp"

using namespace craftwire;

static void test_parse_sections() {
  ConfigLoader cfg;
  std::istringstream in(
      "# comment\n"
      "; another\n"
      "\n"
      "[server]\n"
      "  host =  0.0.0.0  \n"
      "port=25570\r\n"
      "[compression]\n"
      "threshold = 256\n"
      "enabled = yes\n"
      "garbage line\n");
  assert(cfg.parse(in));

  assert(cfg.get("server", "host") == "0.0.0.0");
  assert(cfg.getInt("server", "port") == 25570);
  assert(cfg.getInt("compression", "threshold") == 256);
  assert(cfg.getBool("compression", "enabled"));
  assert(!cfg.getBool("compression", "missing"));
  assert(cfg.get("server", "missing", "dflt") == "dflt");
  assert(!cfg.has("", "garbage line"));
  assert(cfg.size() == 4);
}

static void test_bad_int_falls_back() {
  ConfigLoader cfg;
  std::istringstream in("[framer]\nmax_frame_size = lots\nring_capacity = 12abc\n");
  cfg.parse(in);
  assert(cfg.getInt("framer", "max_frame_size", 7) == 7);
  assert(cfg.getInt("framer", "ring_capacity", 3) == 3);
}

static void test_settings_defaults() {
  ConfigLoader cfg;
  Settings s = Settings::from(cfg);

  assert(s.mempool.buf_size == 12);
  assert(s.mempool.page_entries == 64);
  assert(s.mempool.concurrent_allocation_limit == 1);
  assert(s.mempool.thread_cache == 64);
  assert(s.framer.max_frame_size == 2097152);
  assert(s.framer.max_packet_size == 8388608);
  assert(s.framer.ring_capacity == 16);
  assert(s.compression.threshold == -1);
  assert(s.compression.level == 6);
  assert(s.server.host == "127.0.0.1");
  assert(s.server.port == 25565);

  ConnectionLimits l = s.limits();
  assert(l.max_frame_size == 2097152);
  assert(l.ring_bits == 4);
}

static void test_settings_overrides() {
  ConfigLoader cfg;
  std::istringstream in(
      "[mempool]\nbuf_size = 14\npage_entries = 0x20\n"
      "[framer]\nring_capacity = 20\n"
      "[compression]\nthreshold = 256\nlevel = 9\n"
      "[server]\nport = 4000\n");
  cfg.parse(in);

  Settings s = Settings::from(cfg);
  assert(s.mempool.buf_size == 14);
  assert(s.mempool.page_entries == 32);
  assert(s.compression.threshold == 256);
  assert(s.compression.level == 9);
  assert(s.server.port == 4000);
  assert(s.limits().ring_bits == 5);
}

static void test_settings_out_of_range() {
  const char* bad[] = {
      "[mempool]\nbuf_size = 2\n",
      "[mempool]\nthread_cache = 65\n",
      "[compression]\nlevel = 10\n",
      "[server]\nport = 70000\n",
      "[framer]\nmax_frame_size = 0\n",
  };
  for (const char* text : bad) {
    ConfigLoader cfg;
    std::istringstream in(text);
    cfg.parse(in);

    bool threw = false;
    try {
      Settings::from(cfg);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

static void test_dump_masks_secrets() {
  ConfigLoader cfg;
  std::istringstream in("[server]\nsecret = hunter2\nhost = h\n");
  cfg.parse(in);

  std::ostringstream out;
  cfg.dump(out);
  const std::string text = out.str();
  assert(text.find("hunter2") == std::string::npos);
  assert(text.find("server.secret = ********") != std::string::npos);
  assert(text.find("server.host = h") != std::string::npos);
}

static void test_load_missing_file() {
  ConfigLoader cfg;
  assert(!cfg.load("/nonexistent/craftwire/config.ini") || cfg.size() > 0);
}

int main() {
  test_parse_sections();
  test_bad_int_falls_back();
  test_settings_defaults();
  test_settings_overrides();
  test_settings_out_of_range();
  test_dump_masks_secrets();
  test_load_missing_file();
  return 0;
}
