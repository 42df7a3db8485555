#include "msgs_cache.hpp"

namespace msgstore::stores::file {

void MsgsCache::Add(uint64_t seq, MsgPtr msg, bool is_new, int64_t now) {
  const int64_t expiration = kCacheTTLNanos + (is_new ? msg->timestamp() : now);

  if (auto it = seq_map_.find(seq); it != seq_map_.end()) {
    entries_.erase(it->second);
    seq_map_.erase(it);
  }
  entries_.push_back({seq, expiration, std::move(msg)});
  seq_map_[seq] = std::prev(entries_.end());
  if (seq_map_.size() == 1) {
    try_evict_.store(true, std::memory_order_release);
  }
}

MsgPtr MsgsCache::Get(uint64_t seq, int64_t now) {
  auto it = seq_map_.find(seq);
  if (it == seq_map_.end()) {
    return nullptr;
  }
  // Move to tail, the most recently used.
  entries_.splice(entries_.end(), entries_, it->second);
  it->second->expiration = now + kCacheTTLNanos;
  return it->second->msg;
}

void MsgsCache::Evict(int64_t now) {
  if (entries_.empty()) {
    try_evict_.store(false, std::memory_order_release);
    return;
  }
  if (now >= entries_.back().expiration) {
    entries_.clear();
    seq_map_.clear();
    try_evict_.store(false, std::memory_order_release);
    return;
  }
  while (!entries_.empty() && entries_.front().expiration <= now) {
    seq_map_.erase(entries_.front().seq);
    entries_.pop_front();
  }
}

} // namespace msgstore::stores::file
