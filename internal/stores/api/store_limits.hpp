#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace msgstore::stores {

struct MsgStoreLimits {
  int64_t                  max_msgs  = 0;
  int64_t                  max_bytes = 0;
  std::chrono::nanoseconds max_age{0};
};

struct SubStoreLimits {
  int64_t max_subscriptions = 0;
};

struct ChannelLimits {
  MsgStoreLimits msgs;
  SubStoreLimits subs;
};

/*
  Global limits plus per-channel overrides.

  A zero value means "unlimited" at the global level, and "inherit the
  global value" in a per-channel override. Build() must be called before
  the limits are handed to a store (the stores do it on SetLimits).
*/
struct StoreLimits {
  int64_t                              max_channels = 0;
  ChannelLimits                        channel;
  std::map<std::string, ChannelLimits> per_channel;

  // Validates and applies inheritance. Throws util::InvalidConfig and leaves
  // this value untouched on any violation. Calling it again is a no-op.
  void Build();

  // Limits in effect for `channel`: its override if any, the globals otherwise.
  const ChannelLimits& ForChannel(const std::string& channel) const;
};

StoreLimits DefaultStoreLimits();

} // namespace msgstore::stores
