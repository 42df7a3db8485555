#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <unordered_map>

#include "internal/stores/api/store.hpp"

namespace msgstore::stores::file {

inline constexpr int64_t kCacheTTLNanos = 1'000'000'000;

/*
  Recently stored or looked up messages, oldest first.

  Entries live for kCacheTTLNanos after being stored or last hit.
  Not synchronized, except for the eviction hint which the background
  task polls without the store lock.
*/
class MsgsCache {
 public:
  // A new message expires relative to its timestamp, a looked up one
  // relative to `now`.
  void   Add(uint64_t seq, MsgPtr msg, bool is_new, int64_t now);
  MsgPtr Get(uint64_t seq, int64_t now);
  void   Evict(int64_t now);

  bool TryEvict() const {
    return try_evict_.load(std::memory_order_acquire);
  }

  size_t size() const {
    return seq_map_.size();
  }

 private:
  struct CachedMsg {
    uint64_t seq;
    int64_t  expiration;
    MsgPtr   msg;
  };

  std::list<CachedMsg>                                          entries_;
  std::unordered_map<uint64_t, std::list<CachedMsg>::iterator> seq_map_;
  std::atomic<bool>                                             try_evict_{false};
};

} // namespace msgstore::stores::file
