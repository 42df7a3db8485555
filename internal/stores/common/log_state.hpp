#pragma once

#include <cstdint>
#include <string>

#include <spdlog/logger.h>

#include "internal/stores/api/store.hpp"

namespace msgstore::stores {

/*
  Bookkeeping shared by every message log backend.

  Not synchronized: the owning store guards it with its own lock.
*/
struct MsgLogState {
  std::string    subject;
  MsgStoreLimits limits;
  uint64_t       first       = 0;
  uint64_t       last        = 0;
  uint64_t       total_count = 0;
  uint64_t       total_bytes = 0;
  // Set the first time messages are dropped to respect limits.
  bool           hit_limit = false;
  bool           closed    = false;

  bool HasCountOrBytesLimit() const {
    return limits.max_msgs > 0 || limits.max_bytes > 0;
  }

  // True if the oldest message must go, always keeping the last one.
  bool OverLimits() const;

  // Logs the "dropping messages" warning, once per channel.
  void ReportHitLimit(spdlog::logger& logger);
  std::string HitLimitMessage() const;

  MsgsStats Stats() const {
    return {total_count, total_bytes};
  }
};

/*
  Bookkeeping shared by every subscription log backend.
*/
struct SubLogState {
  std::string    subject;
  SubStoreLimits limits;
  int64_t        subs_count = 0;
  uint64_t       max_sub_id = 0;
  bool           closed     = false;

  // Checks the subscriptions limit then assigns the next ID to `sub`.
  // Throws util::TooManySubs.
  void AssignID(v1::SubState& sub);
};

} // namespace msgstore::stores
