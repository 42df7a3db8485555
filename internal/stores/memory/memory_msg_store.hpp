#pragma once

#include <condition_variable>
#include <memory>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

#include <spdlog/logger.h>

#include "internal/stores/common/log_state.hpp"

namespace msgstore::stores::memory {

/*
  Volatile message log.

  Age based expiration runs on a single timer thread, started with the
  first message when the channel has a max age. It sleeps until the
  next expiration instant and is joined on Close().
*/
class MemoryMsgStore final : public MsgStore {
 public:
  MemoryMsgStore(std::string subject, const MsgStoreLimits& limits, std::shared_ptr<spdlog::logger> logger);
  ~MemoryMsgStore() override;

  MsgsStats State() override;
  uint64_t  Store(std::string_view data) override;
  MsgPtr    Lookup(uint64_t seq) override;

  uint64_t                      FirstSequence() override;
  uint64_t                      LastSequence() override;
  std::pair<uint64_t, uint64_t> FirstAndLastSequence() override;
  uint64_t                      GetSequenceFromTimestamp(int64_t timestamp) override;

  MsgPtr FirstMsg() override;
  MsgPtr LastMsg() override;

  void Flush() override;
  void Close() override;

 private:
  MsgPtr Find(uint64_t seq) const;
  void   RunAgeTimer();
  void ExpireMsgs();
  void RemoveFirstMsg();

  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex            mutex_;
  MsgLogState                          log_;
  std::unordered_map<uint64_t, MsgPtr> msgs_;

  // Next expiration in unix nanoseconds, 0 when nothing is scheduled.
  int64_t                     expiration_ = 0;
  std::condition_variable_any timer_cv_;
  std::thread                 age_timer_;
};

} // namespace msgstore::stores::memory
