#pragma once

#include <map>
#include <set>
#include <shared_mutex>

#include "internal/stores/common/log_state.hpp"

namespace msgstore::stores::memory {

/*
  Volatile subscriptions log: state and pending sequences per subscription.
*/
class MemorySubStore final : public SubStore {
 public:
  MemorySubStore(std::string subject, const SubStoreLimits& limits);

  void CreateSub(v1::SubState& sub) override;
  void UpdateSub(const v1::SubState& sub) override;
  void DeleteSub(uint64_t sub_id) override;

  void AddSeqPending(uint64_t sub_id, uint64_t seqno) override;
  void AckSeqPending(uint64_t sub_id, uint64_t seqno) override;

  void Flush() override;
  void Close() override;

  // Snapshot of the live subscriptions and their pending sequences.
  std::vector<RecoveredSubState> Subscriptions() const;

 private:
  struct Subscription {
    v1::SubState       sub;
    std::set<uint64_t> pending;
  };

  void CheckOpen() const;

  mutable std::shared_mutex          mutex_;
  SubLogState                        log_;
  std::map<uint64_t, Subscription> subs_;
};

} // namespace msgstore::stores::memory
