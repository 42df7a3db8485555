#include "store_limits.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace msgstore::stores {

namespace {

void CheckNotNegative(const std::string& scope, const char* name, int64_t value) {
  if (value < 0) {
    throw util::InvalidConfig(fmt::format("{}: {} can't be negative, got {}", scope, name, value));
  }
}

void CheckNotNegative(const std::string& scope, const ChannelLimits& limits) {
  CheckNotNegative(scope, "max_msgs", limits.msgs.max_msgs);
  CheckNotNegative(scope, "max_bytes", limits.msgs.max_bytes);
  CheckNotNegative(scope, "max_age", limits.msgs.max_age.count());
  CheckNotNegative(scope, "max_subscriptions", limits.subs.max_subscriptions);
}

void CheckNotAboveGlobal(const std::string& channel, const char* name, int64_t value, int64_t global) {
  if (global > 0 && value > global) {
    throw util::InvalidConfig(
        fmt::format("{} for channel \"{}\" is {}, greater than the global limit of {}", name, channel, value, global));
  }
}

template <typename T>
void Inherit(T& value, const T& global) {
  if (value == T{}) {
    value = global;
  }
}

} // namespace

void StoreLimits::Build() {
  CheckNotNegative("global limits", "max_channels", max_channels);
  CheckNotNegative("global limits", channel);

  if (per_channel.empty()) {
    return;
  }
  if (max_channels > 0 && static_cast<int64_t>(per_channel.size()) > max_channels) {
    throw util::InvalidConfig(
        fmt::format("too many channels defined ({}), the max channels limit is set to {}", per_channel.size(), max_channels));
  }

  for (const auto& [name, limits] : per_channel) {
    CheckNotNegative("limits for channel \"" + name + "\"", limits);
    CheckNotAboveGlobal(name, "max_msgs", limits.msgs.max_msgs, channel.msgs.max_msgs);
    CheckNotAboveGlobal(name, "max_bytes", limits.msgs.max_bytes, channel.msgs.max_bytes);
    CheckNotAboveGlobal(name, "max_age", limits.msgs.max_age.count(), channel.msgs.max_age.count());
    CheckNotAboveGlobal(name, "max_subscriptions", limits.subs.max_subscriptions, channel.subs.max_subscriptions);
  }

  // Everything is valid, apply inheritance on a copy then commit.
  auto built = per_channel;
  for (auto& [name, limits] : built) {
    Inherit(limits.msgs.max_msgs, channel.msgs.max_msgs);
    Inherit(limits.msgs.max_bytes, channel.msgs.max_bytes);
    Inherit(limits.msgs.max_age, channel.msgs.max_age);
    Inherit(limits.subs.max_subscriptions, channel.subs.max_subscriptions);
  }
  per_channel.swap(built);
}

const ChannelLimits& StoreLimits::ForChannel(const std::string& name) const {
  auto it = per_channel.find(name);
  if (it != per_channel.end()) {
    return it->second;
  }
  return channel;
}

StoreLimits DefaultStoreLimits() {
  StoreLimits limits;
  limits.max_channels                   = 100;
  limits.channel.msgs.max_msgs          = 1000000;
  limits.channel.msgs.max_bytes         = 1000000LL * 1024;
  limits.channel.subs.max_subscriptions = 1000;
  return limits;
}

} // namespace msgstore::stores
