#pragma once

#include <arrow/io/buffered.h>
#include <arrow/io/interfaces.h>

#include <chrono>
#include <cstdint>
#include <memory>

namespace msgstore::stores::file {

// Shrink is requested when the buffer is at most this percent used.
inline constexpr int64_t kBufShrinkThreshold = 50;

inline constexpr std::chrono::seconds kBufShrinkInterval{5};

/*
  Growable write buffer in front of a log file.

  The buffer starts small, doubles (up to `max_size`) when a record does
  not fit, and is halved back towards `min_shrink_size` by a periodic
  task once it has been mostly idle for two consecutive checks.

  Not synchronized: the owning store calls it under its own lock.
*/
class BufferedWriter {
 public:
  BufferedWriter(int64_t min_shrink_size, int64_t max_size);
  ~BufferedWriter();

  BufferedWriter(const BufferedWriter&)            = delete;
  BufferedWriter& operator=(const BufferedWriter&) = delete;

  // Wraps `raw` with a buffer of the current size and returns it.
  std::shared_ptr<arrow::io::OutputStream> CreateNewWriter(std::shared_ptr<arrow::io::OutputStream> raw);

  // Flushes then drops the buffer, leaving the raw stream open.
  void Release();

  // Flushes then grows the buffer so that `required` bytes fit, capped at max.
  void Expand(int64_t required);

  // Returns true if the buffer was flushed to shrink it.
  bool TryShrinkBuffer();

  // Cancels a pending shrink request if the buffer filled up again.
  void CheckShrinkRequest();

  void Flush();

  int64_t Buffered() const;
  int64_t Available() const;

  int64_t buf_size() const {
    return buf_size_;
  }

  int64_t max_size() const {
    return max_size_;
  }

  bool shrink_requested() const {
    return shrink_req_;
  }

  bool active() const {
    return buf_ != nullptr;
  }

 private:
  int64_t PercentFilled() const;

  int64_t min_shrink_size_;
  int64_t max_size_;
  int64_t buf_size_;
  bool    shrink_req_ = false;

  std::shared_ptr<arrow::io::BufferedOutputStream> buf_;
};

} // namespace msgstore::stores::file
