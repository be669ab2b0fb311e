#include <cassert>
#include <cstdint>
#include <variant>
#include <vector>

#include "craftwire/compress/ZlibPipe.hpp"
#include "craftwire/memory/SystemMemPool.hpp"
#include "craftwire/protocol/PacketInflater.hpp"
#include "test_util.h"

using namespace craftwire;

// Frame whose data starts at the first byte, as if the length prefix had
// already been cut off.
static Frame frame_of(BlockAllocator& alloc, const std::vector<uint8_t>& bytes) {
  Frame f;
  f.packet.append(test_util::part_of(alloc, bytes));
  f.data_start = Cursor{};
  return f;
}

static InflaterError::Kind failure_of(PacketInflater& inflater, Frame frame, BlockAllocator& alloc) {
  try {
    inflater.inflate(std::move(frame), alloc);
  } catch (const InflaterError& e) {
    return e.kind();
  }
  assert(false && "inflate succeeded");
  return InflaterError::Kind::ZLIB;
}

static void test_no_compression() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  Packet p = inflater.inflate(frame_of(alloc, {0x1, 0x0}), alloc);

  assert(!p.compressed());
  const Cursor* c = std::get_if<Cursor>(&p.data);
  assert(c != nullptr);
  assert(c->remaining(p.header) == 2);
}

static void test_uncompressed_under_threshold() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  inflater.start_compression(64);

  Packet p = inflater.inflate(frame_of(alloc, {0x0, 0x3, 0x3}), alloc);
  assert(!p.compressed());
  assert(std::get<Cursor>(p.data).remaining(p.header) == 2);
  assert(p.body_size() == 2);
  assert(p.packet_id() == 3);
}

static void test_small_compression() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  inflater.start_compression(64);
  assert(failure_of(inflater, frame_of(alloc, {0x1, 0x3, 0x3}), alloc) ==
         InflaterError::Kind::SMALL_COMPRESSION);
}

static void test_bad_varint() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  inflater.start_compression(64);
  assert(failure_of(inflater, frame_of(alloc, {0xff, 0xff, 0xff, 0xff, 0xff, 0x3, 0x3}), alloc) ==
         InflaterError::Kind::COMPRESSION_SIZE_DECODE_FAIL);
  assert(failure_of(inflater, frame_of(alloc, {0x80}), alloc) ==
         InflaterError::Kind::COMPRESSION_SIZE_DECODE_FAIL);
  assert(failure_of(inflater, frame_of(alloc, {0xff, 0xff, 0xff, 0xff, 0x0f}), alloc) ==
         InflaterError::Kind::COMPRESSION_SIZE_DECODE_FAIL);
}

static void test_normal_compression() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  inflater.start_compression(3);

  Packet p = inflater.inflate(
      frame_of(alloc, {0x4, 120, 156, 99, 100, 98, 102, 1, 0, 0, 24, 0, 11}), alloc);
  assert(p.compressed());

  MultibytesView v = p.body();
  assert(v.get_u8() == 0x1);
  assert(v.get_u8() == 0x2);
  assert(v.get_u8() == 0x3);
  assert(v.get_u8() == 0x4);
  assert(v.remaining() == 0);
  assert(p.packet_id() == 1);
}

static void test_oversized() {
  SystemMemPool alloc;
  PacketInflater inflater(3);
  inflater.start_compression(0);
  assert(failure_of(inflater,
                    frame_of(alloc, {0x4, 120, 156, 99, 100, 98, 102, 1, 0, 0, 24, 0, 11}),
                    alloc) == InflaterError::Kind::OVERSIZED_PACKET);
}

static void test_size_mismatch() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  inflater.start_compression(3);

  // Declares 5 bytes, the stream holds 4.
  assert(failure_of(inflater,
                    frame_of(alloc, {0x5, 120, 156, 99, 100, 98, 102, 1, 0, 0, 24, 0, 11}),
                    alloc) == InflaterError::Kind::SIZE_MISMATCH);

  // Declares 3 bytes, the stream holds 4.
  assert(failure_of(inflater,
                    frame_of(alloc, {0x3, 120, 156, 99, 100, 98, 102, 1, 0, 0, 24, 0, 11}),
                    alloc) == InflaterError::Kind::ZLIB);

  // A good packet still decodes after both failures.
  Packet p = inflater.inflate(
      frame_of(alloc, {0x4, 120, 156, 99, 100, 98, 102, 1, 0, 0, 24, 0, 11}), alloc);
  assert(p.body_size() == 4);
}

static void test_corrupt_stream() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  inflater.start_compression(3);
  assert(failure_of(inflater, frame_of(alloc, {0x4, 0x12, 0x34, 0x56}), alloc) ==
         InflaterError::Kind::ZLIB);
}

static void test_compression_off_again() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);
  inflater.start_compression(64);
  assert(inflater.compression());
  inflater.start_compression(-1);
  assert(!inflater.compression());

  Packet p = inflater.inflate(frame_of(alloc, {0x1, 0x3, 0x3}), alloc);
  assert(p.body_size() == 3);
}

static void test_data_after_prefix() {
  SystemMemPool alloc;
  PacketInflater inflater(1 << 20);

  // Length prefix still attached, data_start past it.
  Frame f;
  f.packet.append(test_util::part_of(alloc, {0x2, 0x7, 0x9}));
  f.data_start = Cursor{0, 1};
  Packet p = inflater.inflate(std::move(f), alloc);
  assert(p.packet_id() == 7);
  assert(p.body_size() == 2);
}

int main() {
  test_no_compression();
  test_uncompressed_under_threshold();
  test_small_compression();
  test_bad_varint();
  test_normal_compression();
  test_oversized();
  test_size_mismatch();
  test_corrupt_stream();
  test_compression_off_again();
  test_data_after_prefix();
  return 0;
}
