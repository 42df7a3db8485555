#pragma once

#include <any>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/stores/api/store_limits.hpp"
#include "msgstore/v1/protocol.pb.h"
#include "msgstore/v1/server.pb.h"

namespace msgstore::stores {

inline constexpr const char* kTypeMemory = "MEMORY";
inline constexpr const char* kTypeFile   = "FILE";

// Pass to Store::MsgsState to aggregate over every channel.
inline constexpr const char* kAllChannels = "*";

using MsgPtr = std::shared_ptr<const v1::MsgProto>;

struct MsgsStats {
  uint64_t count = 0;
  uint64_t bytes = 0;
};

struct Client {
  v1::ClientInfo info;
  std::any       user_data;
};

struct RecoveredSubState {
  v1::SubState       sub;
  std::set<uint64_t> pending;
};

using RecoveredSubscriptions = std::unordered_map<std::string, std::vector<RecoveredSubState>>;

struct RecoveredState {
  v1::ServerInfo         info;
  std::vector<Client>    clients;
  RecoveredSubscriptions subs;
};

// ------------------------------------------------------------
// MsgStore: per channel message log
// ------------------------------------------------------------

class MsgStore {
 public:
  virtual ~MsgStore() = default;

  virtual MsgsStats State() = 0;

  // Stores `data` and returns the assigned sequence.
  virtual uint64_t Store(std::string_view data) = 0;

  // Returns nullptr when `seq` is not in the log.
  virtual MsgPtr Lookup(uint64_t seq) = 0;

  virtual uint64_t                      FirstSequence()        = 0;
  virtual uint64_t                      LastSequence()         = 0;
  virtual std::pair<uint64_t, uint64_t> FirstAndLastSequence() = 0;

  // Sequence of the first message whose timestamp is >= `timestamp`.
  virtual uint64_t GetSequenceFromTimestamp(int64_t timestamp) = 0;

  virtual MsgPtr FirstMsg() = 0;
  virtual MsgPtr LastMsg()  = 0;

  virtual void Flush() = 0;
  virtual void Close() = 0;
};

// ------------------------------------------------------------
// SubStore: per channel subscriptions log
// ------------------------------------------------------------

class SubStore {
 public:
  virtual ~SubStore() = default;

  // Records a new subscription and assigns `sub.id`.
  virtual void CreateSub(v1::SubState& sub) = 0;
  virtual void UpdateSub(const v1::SubState& sub) = 0;
  virtual void DeleteSub(uint64_t sub_id) = 0;

  virtual void AddSeqPending(uint64_t sub_id, uint64_t seqno) = 0;
  virtual void AckSeqPending(uint64_t sub_id, uint64_t seqno) = 0;

  virtual void Flush() = 0;
  virtual void Close() = 0;
};

struct ChannelStore {
  std::any                  user_data;
  std::unique_ptr<SubStore> subs;
  std::unique_ptr<MsgStore> msgs;
};

// ------------------------------------------------------------
// Store: factory for channels, and client registry
// ------------------------------------------------------------

class Store {
 public:
  virtual ~Store() = default;

  // Persists the server identity. Calling it again replaces the previous one.
  virtual void Init(const v1::ServerInfo& info) = 0;

  virtual std::string Name() const = 0;

  virtual void SetLimits(const StoreLimits& limits) = 0;

  // Returns the channel and true if it was created by this call.
  virtual std::pair<ChannelStore*, bool> CreateChannel(const std::string& channel, std::any user_data) = 0;
  virtual ChannelStore*                  LookupChannel(const std::string& channel) = 0;
  virtual bool                           HasChannel() = 0;

  // `channel` may be kAllChannels. An unknown channel reports zeros.
  virtual MsgsStats MsgsState(const std::string& channel) = 0;

  // Returns the client and true if it was added by this call.
  virtual std::pair<Client, bool>                  AddClient(const std::string& client_id, const std::string& hb_inbox, std::any user_data) = 0;
  virtual std::optional<Client>                    GetClient(const std::string& client_id) = 0;
  virtual std::unordered_map<std::string, Client> GetClients() = 0;
  virtual size_t                                   GetClientsCount() = 0;
  virtual std::optional<Client>                    DeleteClient(const std::string& client_id) = 0;

  virtual void Close() = 0;
};

} // namespace msgstore::stores
