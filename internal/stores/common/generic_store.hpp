#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/stores/api/store.hpp"

namespace msgstore::stores {

/*
  Channel and client registries shared by every Store backend.

  Backends own one of these and forward the registry part of the Store
  interface to it. What differs per backend (materializing a channel's
  logs, persisting client records) is passed in as callbacks, which run
  under the registry's exclusive lock.
*/
class GenericStore {
 public:
  using ChannelFactory = std::function<std::unique_ptr<ChannelStore>(const std::string& channel, const ChannelLimits& limits)>;
  using ClientHook     = std::function<void(const Client& client)>;
  using DeleteHook     = std::function<void(const Client& deleted, const std::unordered_map<std::string, Client>& remaining)>;

  GenericStore(std::string name, const StoreLimits& limits);

  const std::string& Name() const {
    return name_;
  }

  void        SetLimits(const StoreLimits& limits);
  StoreLimits Limits() const;

  std::pair<ChannelStore*, bool> CreateChannel(const std::string& channel, std::any user_data, const ChannelFactory& factory);
  ChannelStore*                  LookupChannel(const std::string& channel) const;
  bool                           HasChannel() const;
  MsgsStats                      MsgsState(const std::string& channel) const;

  // Registers a channel rebuilt from persisted state.
  void AddRecoveredChannel(const std::string& channel, std::unique_ptr<ChannelStore> store);

  // `persist` runs only for a new client; if it throws, the client is not added.
  std::pair<Client, bool> AddClient(const std::string& client_id, const std::string& hb_inbox, std::any user_data,
                                    const ClientHook& persist = {});
  std::optional<Client>                   GetClient(const std::string& client_id) const;
  std::unordered_map<std::string, Client> GetClients() const;
  size_t                                  GetClientsCount() const;
  // `persist` runs once the client is removed from the registry; if it
  // throws, the client is put back.
  std::optional<Client> DeleteClient(const std::string& client_id, const DeleteHook& persist = {});

  void AddRecoveredClient(Client client);

  // Closes every channel's logs. Returns false if already closed. Every
  // log is closed even on failure; the first error is then rethrown.
  bool Close();

 private:
  struct State {
    StoreLimits                                                   limits;
    std::unordered_map<std::string, std::unique_ptr<ChannelStore>> channels;
    std::unordered_map<std::string, Client>                       clients;
    bool                                                          closed = false;
  };

  const std::string         name_;
  mutable std::shared_mutex mutex_;
  State                     state_;
};

} // namespace msgstore::stores
