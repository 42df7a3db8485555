#include "log_state.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace msgstore::stores {

using namespace msgstore::observability;

bool MsgLogState::OverLimits() const {
  if (total_count <= 1) {
    return false;
  }
  return (limits.max_msgs > 0 && total_count > static_cast<uint64_t>(limits.max_msgs)) ||
         (limits.max_bytes > 0 && total_bytes > static_cast<uint64_t>(limits.max_bytes));
}

void MsgLogState::ReportHitLimit(spdlog::logger& logger) {
  if (hit_limit) {
    return;
  }
  hit_limit = true;
  Log(logger, spdlog::level::warn, HitLimitMessage());
}

std::string MsgLogState::HitLimitMessage() const {
  return fmt::format("Reached limits for store \"{}\" (msgs={}/{} bytes={}/{}), dropping old messages to make room for new ones.",
                     subject, total_count, limits.max_msgs, total_bytes, limits.max_bytes);
}

void SubLogState::AssignID(v1::SubState& sub) {
  if (limits.max_subscriptions > 0 && subs_count >= limits.max_subscriptions) {
    throw util::TooManySubs();
  }
  // Bump the max value before assigning it to the new subscription.
  ++max_sub_id;
  ++subs_count;
  sub.set_id(max_sub_id);
}

} // namespace msgstore::stores
