#include "buffered_writer.hpp"

#include <arrow/memory_pool.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/stores/file/file_io.hpp"

namespace msgstore::stores::file {

BufferedWriter::BufferedWriter(int64_t min_shrink_size, int64_t max_size)
    : min_shrink_size_(min_shrink_size), max_size_(max_size), buf_size_(std::min(min_shrink_size, max_size)) {
}

BufferedWriter::~BufferedWriter() {
  // The raw stream belongs to the store, don't let the wrapper close it.
  if (!buf_) {
    return;
  }
  auto detached = buf_->Detach();
  if (!detached.ok()) {
    observability::LogError("failed to flush write buffer", {observability::StringField("error", detached.status().ToString())});
  }
}

std::shared_ptr<arrow::io::OutputStream> BufferedWriter::CreateNewWriter(std::shared_ptr<arrow::io::OutputStream> raw) {
  if (buf_) {
    Release();
  }
  buf_ = Unwrap(arrow::io::BufferedOutputStream::Create(buf_size_, arrow::default_memory_pool(), std::move(raw)));
  return buf_;
}

void BufferedWriter::Release() {
  if (!buf_) {
    return;
  }
  auto buf = std::move(buf_);
  // Detach flushes what is buffered.
  Unwrap(buf->Detach());
}

void BufferedWriter::Expand(int64_t required) {
  shrink_req_ = false;
  if (buf_->bytes_buffered() > 0) {
    Unwrap(buf_->Flush());
  }
  buf_size_ = std::min(std::max(buf_size_ * 2, required), max_size_);
  Unwrap(buf_->SetBufferSize(buf_size_));
}

bool BufferedWriter::TryShrinkBuffer() {
  if (buf_size_ == min_shrink_size_ || !buf_) {
    return false;
  }
  if (!shrink_req_) {
    if (PercentFilled() <= kBufShrinkThreshold) {
      shrink_req_ = true;
    }
    // Check again on next tick.
    return false;
  }
  Unwrap(buf_->Flush());
  buf_size_ = std::max(buf_size_ / 2, min_shrink_size_);
  Unwrap(buf_->SetBufferSize(buf_size_));
  // Keep requesting until down to the minimum.
  if (buf_size_ == min_shrink_size_) {
    shrink_req_ = true;
  }
  return true;
}

void BufferedWriter::CheckShrinkRequest() {
  if (PercentFilled() > kBufShrinkThreshold) {
    shrink_req_ = false;
  }
}

void BufferedWriter::Flush() {
  if (buf_ && buf_->bytes_buffered() > 0) {
    Unwrap(buf_->Flush());
  }
}

int64_t BufferedWriter::Buffered() const {
  return buf_ ? buf_->bytes_buffered() : 0;
}

int64_t BufferedWriter::Available() const {
  return buf_ ? buf_->buffer_size() - buf_->bytes_buffered() : 0;
}

int64_t BufferedWriter::PercentFilled() const {
  return buf_size_ > 0 ? Buffered() * 100 / buf_size_ : 0;
}

} // namespace msgstore::stores::file
