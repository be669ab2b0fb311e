#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <boost/asio/buffer.hpp>

#include "craftwire/buffer/Multibytes.hpp"
#include "craftwire/memory/SystemMemPool.hpp"
#include "test_util.h"

using namespace craftwire;
using test_util::pages_of;
using test_util::part_of;

static Multibytes make_test_mb(BlockAllocator& alloc) {
  return pages_of(alloc, {{1, 2, 3, 4}, {5, 6}, {}, {7, 8, 9}, {10}});
}

static std::vector<uint8_t> bytes_of(const boost::asio::const_buffer& b) {
  const uint8_t* p = static_cast<const uint8_t*>(b.data());
  return std::vector<uint8_t>(p, p + b.size());
}

static void test_cursor_advance() {
  SystemMemPool alloc;
  Multibytes mb = make_test_mb(alloc);
  Cursor cursor = mb.cursor();

  assert(cursor.advance(mb, 3));
  assert(cursor.advance(mb, 7));
  assert(!cursor.advance(mb, 1));
}

static void test_cursor_remaining() {
  SystemMemPool alloc;
  Multibytes mb = make_test_mb(alloc);
  Cursor cursor = mb.cursor();

  assert(cursor.remaining(mb) == 10);
  cursor.advance(mb, 3);
  assert(cursor.remaining(mb) == 7);
  cursor.advance(mb, 7);
  assert(cursor.remaining(mb) == 0);
  cursor.advance(mb, 1);
  assert(cursor.remaining(mb) == 0);
}

static void test_cursor_has_atleast() {
  SystemMemPool alloc;
  Multibytes mb = make_test_mb(alloc);
  Cursor cursor = mb.cursor();

  assert(cursor.has_atleast(mb, 0));
  assert(cursor.has_atleast(mb, 3));
  assert(cursor.has_atleast(mb, 9));
  assert(cursor.has_atleast(mb, 10));
  assert(!cursor.has_atleast(mb, 11));
  cursor.advance(mb, 3);
  assert(cursor.has_atleast(mb, 7));
  cursor.advance(mb, 7);
  assert(!cursor.has_atleast(mb, 1));
  assert(cursor.has_atleast(mb, 0));
  cursor.advance(mb, 1);
  assert(!cursor.has_atleast(mb, 1));
  assert(!cursor.has_atleast(mb, 0));
}

static void test_cursor_bytes_vectored() {
  SystemMemPool alloc;
  Multibytes mb = make_test_mb(alloc);
  Cursor cursor = mb.cursor();

  boost::asio::const_buffer io[4];
  assert(cursor.bytes_vectored(mb, io, 0) == 0);

  assert(cursor.bytes_vectored(mb, io, 4) == 4);
  assert(bytes_of(io[0]) == std::vector<uint8_t>({1, 2, 3, 4}));
  assert(bytes_of(io[1]) == std::vector<uint8_t>({5, 6}));
  assert(bytes_of(io[2]) == std::vector<uint8_t>({7, 8, 9}));
  assert(bytes_of(io[3]) == std::vector<uint8_t>({10}));

  cursor.advance(mb, 3);
  assert(cursor.bytes_vectored(mb, io, 4) == 4);
  assert(bytes_of(io[0]) == std::vector<uint8_t>({4}));
  assert(bytes_of(io[1]) == std::vector<uint8_t>({5, 6}));

  cursor.advance(mb, 2);
  assert(cursor.bytes_vectored(mb, io, 4) == 3);
  assert(bytes_of(io[0]) == std::vector<uint8_t>({6}));
  assert(bytes_of(io[1]) == std::vector<uint8_t>({7, 8, 9}));
  assert(bytes_of(io[2]) == std::vector<uint8_t>({10}));

  // Short destination: stops when full.
  assert(mb.cursor().bytes_vectored(mb, io, 2) == 2);
  assert(bytes_of(io[1]) == std::vector<uint8_t>({5, 6}));

  cursor.advance(mb, 5);
  assert(cursor.bytes_vectored(mb, io, 4) == 0);
}

static void test_cursor_run_off_end() {
  SystemMemPool alloc;
  Multibytes mb = make_test_mb(alloc);
  Cursor cursor = mb.cursor();

  for (int i = 0; i < 10; ++i) {
    cursor.advance(mb, 1);
    assert(cursor.run_off_end(mb) == 0);
  }

  cursor.advance(mb, 1);
  assert(cursor.run_off_end(mb) == 1);
  mb.append(part_of(alloc, {11, 12}));
  assert(cursor.run_off_end(mb) == 0);
  cursor.advance(mb, 101);
  assert(cursor.run_off_end(mb) == 100);
}

static void test_partition_before() {
  SystemMemPool alloc;
  Multibytes mb = make_test_mb(alloc);
  Cursor cursor = mb.cursor();

  Multibytes empty = mb.partition_before(cursor);
  assert(empty.page_count() == 0);

  cursor.advance(mb, 1);
  Multibytes one = mb.partition_before(cursor);
  assert(mb.page_count() == 5);
  assert(one.page_count() == 1);
  assert(one.to_vector() == std::vector<uint8_t>({1}));
  assert(mb.page(0).size() == 3 && mb.page(0)[0] == 2);
  // Both halves share the first block.
  assert(mb.page(0).use_count() == 2);

  cursor = mb.cursor();
  cursor.advance(mb, 3);
  Multibytes two = mb.partition_before(cursor);
  assert(mb.page_count() == 4);
  assert(two.page_count() == 1);
  assert(two.to_vector() == std::vector<uint8_t>({2, 3, 4}));
  assert(mb.page(0).size() == 2 && mb.page(0)[0] == 5);

  assert(mb.to_vector() == std::vector<uint8_t>({5, 6, 7, 8, 9, 10}));

  bool threw = false;
  try {
    mb.partition_before(Cursor{9, 1});
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

static void test_view_reads_across_pages() {
  SystemMemPool alloc;
  Multibytes mb = make_test_mb(alloc);
  MultibytesView v = mb.view();

  assert(v.remaining() == 10);
  assert(v.get_u8() == 1);
  v.advance(4);
  assert(v.get_u8() == 6);
  assert(v.get_u8() == 7);

  uint8_t out[3] = {0};
  v.copy_to(out, 3);
  assert(out[0] == 8 && out[1] == 9 && out[2] == 10);
  assert(v.remaining() == 0);

  bool threw = false;
  try {
    v.get_u8();
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  MultibytesView at = mb.view_at(Cursor{1, 2});
  assert(at.cursor() == (Cursor{3, 0}));
  assert(at.get_u8() == 7);
}

static void test_copy_of_spans_blocks() {
  SystemMemPool alloc(4);  // 12 usable bytes per block
  std::vector<uint8_t> data(30);
  for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i);

  Multibytes mb = Multibytes::copy_of(alloc, data.data(), data.size());
  assert(mb.page_count() == 3);
  assert(mb.size() == 30);
  assert(mb.to_vector() == data);
}

static void test_byte_cursor() {
  const uint8_t data[] = {1, 2, 3, 4};
  ByteCursor c(data, sizeof(data));
  assert(c.has_atleast(3));
  assert(!c.has_atleast(5));
  assert(c.get_u8() == 1);
  c.advance(2);
  assert(c.get_u8() == 4);
  assert(c.remaining() == 0);
}

int main() {
  test_cursor_advance();
  test_cursor_remaining();
  test_cursor_has_atleast();
  test_cursor_bytes_vectored();
  test_cursor_run_off_end();
  test_partition_before();
  test_view_reads_across_pages();
  test_copy_of_spans_blocks();
  test_byte_cursor();
  return 0;
}
