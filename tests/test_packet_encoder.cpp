#include <cassert>
#include <cstdint>
#include <vector>

#include "craftwire/compress/ZlibPipe.hpp"
#include "craftwire/memory/SystemMemPool.hpp"
#include "craftwire/protocol/PacketEncoder.hpp"
#include "craftwire/protocol/Packetizer.hpp"
#include "craftwire/protocol/Varint.hpp"
#include "test_util.h"

using namespace craftwire;

static std::vector<uint8_t> encode(PacketEncoder& enc, BlockAllocator& alloc,
                                   const std::vector<uint8_t>& body) {
  return enc.encode(Multibytes::copy_of(alloc, body.data(), body.size()), alloc).to_vector();
}

static void test_plain() {
  SystemMemPool alloc;
  PacketEncoder enc;
  assert(encode(enc, alloc, {0x05, 0xaa}) == std::vector<uint8_t>({0x02, 0x05, 0xaa}));

  const std::vector<uint8_t> big(300, 0x01);
  const std::vector<uint8_t> wire = encode(enc, alloc, big);
  assert(wire.size() == 302);
  assert(wire[0] == 0xac && wire[1] == 0x02);
}

static void test_below_threshold() {
  SystemMemPool alloc;
  PacketEncoder enc;
  enc.start_compression(64, 6);
  assert(encode(enc, alloc, {0x05, 0xaa}) == std::vector<uint8_t>({0x03, 0x00, 0x05, 0xaa}));
}

static void test_compressed_layout() {
  SystemMemPool alloc;
  PacketEncoder enc;
  enc.start_compression(64, 6);

  const std::vector<uint8_t> body(100, 0x42);
  const std::vector<uint8_t> wire = encode(enc, alloc, body);

  ByteCursor c(wire.data(), wire.size());
  ParseResult<int32_t> frame_len = varint(c);
  assert(frame_len.ok());
  assert(static_cast<size_t>(frame_len.value) == c.remaining());

  ParseResult<int32_t> data_len = varint(c);
  assert(data_len.ok() && data_len.value == 100);

  // zlib stream of the body follows.
  Multibytes z = Multibytes::copy_of(alloc, c.data(), c.remaining());
  Inflater inflate(alloc);
  assert(inflate.process(z, FlushMode::FINISH).to_vector() == body);
}

static void test_threshold_boundary() {
  SystemMemPool alloc;
  PacketEncoder enc;
  enc.start_compression(4, 6);

  // len == threshold compresses.
  const std::vector<uint8_t> wire = encode(enc, alloc, {1, 2, 3, 4});
  ByteCursor c(wire.data(), wire.size());
  varint(c);
  assert(varint(c).value == 4);

  // len < threshold does not.
  assert(encode(enc, alloc, {1, 2, 3}) == std::vector<uint8_t>({0x4, 0x0, 1, 2, 3}));
}

static void test_encrypted() {
  SystemMemPool alloc;
  PacketEncoder enc;
  const AesKey key = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15};
  enc.start_encryption(key);

  // Prefix 0x06 then 0..5; the stream starts at the prefix byte.
  const std::vector<uint8_t> wire = encode(enc, alloc, {1, 2, 3, 4, 5, 6});
  std::vector<uint8_t> expected = {0x06, 1, 2, 3, 4, 5, 6};
  Cryptor check(CryptMode::ENCRYPT);
  check.start_crypto(key);
  check.process(expected.data(), expected.size());
  assert(wire == expected);
}

static void test_compression_off_again() {
  SystemMemPool alloc;
  PacketEncoder enc;
  enc.start_compression(0, 6);
  enc.start_compression(-1, 6);
  assert(!enc.compression());
  assert(encode(enc, alloc, {0x09}) == std::vector<uint8_t>({0x01, 0x09}));
}

static void test_empty_body_zero_threshold() {
  SystemMemPool alloc;
  PacketEncoder enc;
  enc.start_compression(0, 6);

  const std::vector<uint8_t> wire = encode(enc, alloc, {});
  assert(wire == std::vector<uint8_t>({0x01, 0x00}));

  Packetizer pk(1024, 1024);
  pk.start_compression(0);
  pk.feed(test_util::part_of(alloc, wire));
  PacketResult r = pk.next(alloc);
  assert(r.ready());
  assert(!r.packet->compressed());
  assert(r.packet->body_size() == 0);

  // Non-empty bodies still compress at threshold 0.
  const std::vector<uint8_t> one = encode(enc, alloc, {0x07});
  ByteCursor c(one.data(), one.size());
  varint(c);
  assert(varint(c).value == 1);
}

int main() {
  test_plain();
  test_below_threshold();
  test_compressed_layout();
  test_threshold_boundary();
  test_encrypted();
  test_compression_off_again();
  test_empty_body_zero_threshold();
  return 0;
}
