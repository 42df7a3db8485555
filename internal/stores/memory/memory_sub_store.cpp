#include "memory_sub_store.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <mutex>

#include "internal/util/errors.hpp"

namespace msgstore::stores::memory {

MemorySubStore::MemorySubStore(std::string subject, const SubStoreLimits& limits) {
  log_.subject = std::move(subject);
  log_.limits  = limits;
}

void MemorySubStore::CreateSub(v1::SubState& sub) {
  std::unique_lock lock(mutex_);
  CheckOpen();
  log_.AssignID(sub);
  subs_[sub.id()] = Subscription{sub, {}};
}

void MemorySubStore::UpdateSub(const v1::SubState& sub) {
  std::unique_lock lock(mutex_);
  CheckOpen();
  auto [it, inserted] = subs_.try_emplace(sub.id());
  it->second.sub      = sub;
  if (inserted) {
    log_.subs_count++;
    log_.max_sub_id = std::max(log_.max_sub_id, sub.id());
  }
}

void MemorySubStore::DeleteSub(uint64_t sub_id) {
  std::unique_lock lock(mutex_);
  CheckOpen();
  if (subs_.erase(sub_id) > 0) {
    log_.subs_count--;
  }
}

void MemorySubStore::AddSeqPending(uint64_t sub_id, uint64_t seqno) {
  std::unique_lock lock(mutex_);
  CheckOpen();
  auto it = subs_.find(sub_id);
  if (it == subs_.end()) {
    return;
  }
  if (seqno > it->second.sub.last_sent()) {
    it->second.sub.set_last_sent(seqno);
  }
  it->second.pending.insert(seqno);
}

void MemorySubStore::AckSeqPending(uint64_t sub_id, uint64_t seqno) {
  std::unique_lock lock(mutex_);
  CheckOpen();
  auto it = subs_.find(sub_id);
  if (it != subs_.end()) {
    it->second.pending.erase(seqno);
  }
}

void MemorySubStore::Flush() {
}

void MemorySubStore::Close() {
  std::unique_lock lock(mutex_);
  log_.closed = true;
}

// Lock held on entry.
void MemorySubStore::CheckOpen() const {
  if (log_.closed) {
    throw util::InvalidState(fmt::format("subscription store for [{}] is closed", log_.subject));
  }
}

std::vector<RecoveredSubState> MemorySubStore::Subscriptions() const {
  std::shared_lock lock(mutex_);
  std::vector<RecoveredSubState> result;
  result.reserve(subs_.size());
  for (const auto& [id, s] : subs_) {
    result.push_back(RecoveredSubState{s.sub, s.pending});
  }
  return result;
}

} // namespace msgstore::stores::memory
