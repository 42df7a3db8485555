#include "internal/stores/file/buffered_writer.hpp"

#include <arrow/io/memory.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/stores/file/file_io.hpp"

namespace {

using msgstore::stores::file::BufferedWriter;
using msgstore::stores::file::Unwrap;

void Write(arrow::io::OutputStream& out, size_t n) {
  const std::string data(n, 'x');
  Unwrap(out.Write(data.data(), static_cast<int64_t>(data.size())));
}

void TestExpandThenShrinkBackToMinimum() {
  auto           raw = Unwrap(arrow::io::BufferOutputStream::Create());
  BufferedWriter bw(512, 4096);
  assert(bw.buf_size() == 512);

  auto out = bw.CreateNewWriter(raw);
  assert(bw.active());
  Write(*out, 100);
  assert(bw.Buffered() == 100);
  assert(bw.Available() == 412);

  // Flushes, then doubles at least.
  bw.Expand(1000);
  assert(bw.buf_size() == 1024);
  assert(bw.Buffered() == 0);
  assert(Unwrap(raw->Tell()) == 100);

  // First tick only requests.
  assert(!bw.TryShrinkBuffer());
  assert(bw.shrink_requested());
  // Second tick shrinks, down to the minimum here.
  assert(bw.TryShrinkBuffer());
  assert(bw.buf_size() == 512);
  assert(!bw.TryShrinkBuffer());

  bw.Release();
  assert(!bw.active());
}

void TestExpandIsCappedAtMax() {
  auto           raw = Unwrap(arrow::io::BufferOutputStream::Create());
  BufferedWriter bw(512, 4096);
  (void)bw.CreateNewWriter(raw);
  bw.Expand(100000);
  assert(bw.buf_size() == 4096);
}

void TestBusyBufferCancelsShrinkRequest() {
  auto           raw = Unwrap(arrow::io::BufferOutputStream::Create());
  BufferedWriter bw(512, 4096);
  auto           out = bw.CreateNewWriter(raw);
  bw.Expand(2048);
  assert(bw.buf_size() == 2048);

  assert(!bw.TryShrinkBuffer());
  assert(bw.shrink_requested());

  // More than half full.
  Write(*out, 1500);
  bw.CheckShrinkRequest();
  assert(!bw.shrink_requested());

  bw.Flush();
  assert(bw.Buffered() == 0);
  assert(Unwrap(raw->Tell()) == 1500);
}

void TestReleaseFlushesAndKeepsRawOpen() {
  auto raw = Unwrap(arrow::io::BufferOutputStream::Create());
  {
    BufferedWriter bw(512, 4096);
    auto           out = bw.CreateNewWriter(raw);
    Write(*out, 10);
    bw.Release();
  }
  assert(!raw->closed());
  Write(*raw, 5);
  assert(Unwrap(raw->Tell()) == 15);
}

} // namespace

int main() {
  TestExpandThenShrinkBackToMinimum();
  TestExpandIsCappedAtMax();
  TestBusyBufferCancelsShrinkRequest();
  TestReleaseFlushesAndKeepsRawOpen();

  std::cout << "msgstore_unit_buffered_writer: pass\n";
  return 0;
}
