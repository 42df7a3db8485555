#include "memory_msg_store.hpp"

#include <spdlog/fmt/fmt.h>

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace msgstore::stores::memory {

using namespace msgstore::observability;

MemoryMsgStore::MemoryMsgStore(std::string subject, const MsgStoreLimits& limits, std::shared_ptr<spdlog::logger> logger)
    : logger_(ResolveLogger(std::move(logger))) {
  log_.subject = std::move(subject);
  log_.limits  = limits;
}

MemoryMsgStore::~MemoryMsgStore() {
  try {
    Close();
  } catch (const std::exception& e) {
    Log(*logger_, spdlog::level::err, "failed to close message store", {StringField("channel", log_.subject), StringField("error", e.what())});
  }
}

MsgsStats MemoryMsgStore::State() {
  std::shared_lock lock(mutex_);
  return log_.Stats();
}

uint64_t MemoryMsgStore::Store(std::string_view data) {
  std::unique_lock lock(mutex_);
  if (log_.closed) {
    throw util::InvalidState(fmt::format("message store for [{}] is closed", log_.subject));
  }

  if (log_.first == 0) {
    log_.first = 1;
  }
  ++log_.last;

  auto msg = std::make_shared<v1::MsgProto>();
  msg->set_sequence(log_.last);
  msg->set_subject(log_.subject);
  msg->set_data(std::string(data));
  msg->set_timestamp(util::NowNanos());

  log_.total_count++;
  log_.total_bytes += msg->ByteSizeLong();

  const auto max_age = log_.limits.max_age.count();
  if (max_age > 0 && expiration_ == 0) {
    expiration_ = msg->timestamp() + max_age;
    if (!age_timer_.joinable()) {
      age_timer_ = std::thread(&MemoryMsgStore::RunAgeTimer, this);
    } else {
      timer_cv_.notify_one();
    }
  }
  msgs_.emplace(log_.last, std::move(msg));

  if (log_.HasCountOrBytesLimit()) {
    while (log_.OverLimits()) {
      RemoveFirstMsg();
      log_.ReportHitLimit(*logger_);
    }
  }
  return log_.last;
}

MsgPtr MemoryMsgStore::Lookup(uint64_t seq) {
  std::shared_lock lock(mutex_);
  return Find(seq);
}

uint64_t MemoryMsgStore::FirstSequence() {
  std::shared_lock lock(mutex_);
  return log_.first;
}

uint64_t MemoryMsgStore::LastSequence() {
  std::shared_lock lock(mutex_);
  return log_.last;
}

std::pair<uint64_t, uint64_t> MemoryMsgStore::FirstAndLastSequence() {
  std::shared_lock lock(mutex_);
  return {log_.first, log_.last};
}

uint64_t MemoryMsgStore::GetSequenceFromTimestamp(int64_t timestamp) {
  std::shared_lock lock(mutex_);

  if (msgs_.empty()) {
    return log_.last + 1;
  }
  // Sequences are contiguous in [first, last], search for the first
  // message stored at or after `timestamp`.
  uint64_t low  = log_.first;
  uint64_t high = log_.last + 1;
  while (low < high) {
    uint64_t mid = low + (high - low) / 2;
    if (msgs_.at(mid)->timestamp() >= timestamp) {
      high = mid;
    } else {
      low = mid + 1;
    }
  }
  return low;
}

MsgPtr MemoryMsgStore::FirstMsg() {
  std::shared_lock lock(mutex_);
  return Find(log_.first);
}

MsgPtr MemoryMsgStore::LastMsg() {
  std::shared_lock lock(mutex_);
  return Find(log_.last);
}

void MemoryMsgStore::Flush() {
}

void MemoryMsgStore::Close() {
  {
    std::unique_lock lock(mutex_);
    if (log_.closed) {
      return;
    }
    log_.closed = true;
  }
  timer_cv_.notify_all();
  if (age_timer_.joinable()) {
    age_timer_.join();
  }
}

void MemoryMsgStore::RunAgeTimer() {
  std::unique_lock lock(mutex_);
  while (!log_.closed) {
    if (expiration_ == 0) {
      timer_cv_.wait(lock);
      continue;
    }
    const util::TimePoint deadline{std::chrono::duration_cast<util::Clock::duration>(std::chrono::nanoseconds(expiration_))};
    timer_cv_.wait_until(lock, deadline);
    if (!log_.closed && expiration_ > 0 && util::NowNanos() >= expiration_) {
      ExpireMsgs();
    }
  }
}

MsgPtr MemoryMsgStore::Find(uint64_t seq) const {
  auto it = msgs_.find(seq);
  return it == msgs_.end() ? nullptr : it->second;
}

// Lock held on entry.
void MemoryMsgStore::ExpireMsgs() {
  const int64_t now     = util::NowNanos();
  const int64_t max_age = log_.limits.max_age.count();
  while (true) {
    auto it = msgs_.find(log_.first);
    if (it == msgs_.end()) {
      expiration_ = 0;
      return;
    }
    const int64_t elapsed = now - it->second->timestamp();
    if (elapsed >= max_age) {
      RemoveFirstMsg();
    } else {
      expiration_ = now + (max_age - elapsed);
      return;
    }
  }
}

// Lock held on entry.
void MemoryMsgStore::RemoveFirstMsg() {
  auto it = msgs_.find(log_.first);
  log_.total_bytes -= it->second->ByteSizeLong();
  log_.total_count--;
  msgs_.erase(it);
  log_.first++;
}

} // namespace msgstore::stores::memory
