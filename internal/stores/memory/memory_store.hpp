#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "internal/stores/common/generic_store.hpp"

namespace msgstore::stores::memory {

/*
  Store whose channels and clients live in memory only. Nothing survives
  Close(); Init() is accepted and ignored.
*/
class MemoryStore final : public Store {
 public:
  explicit MemoryStore(const StoreLimits& limits = DefaultStoreLimits(), std::shared_ptr<spdlog::logger> logger = nullptr);
  ~MemoryStore() override;

  void        Init(const v1::ServerInfo& info) override;
  std::string Name() const override;
  void        SetLimits(const StoreLimits& limits) override;

  std::pair<ChannelStore*, bool> CreateChannel(const std::string& channel, std::any user_data) override;
  ChannelStore*                  LookupChannel(const std::string& channel) override;
  bool                           HasChannel() override;
  MsgsStats                      MsgsState(const std::string& channel) override;

  std::pair<Client, bool>                  AddClient(const std::string& client_id, const std::string& hb_inbox, std::any user_data) override;
  std::optional<Client>                    GetClient(const std::string& client_id) override;
  std::unordered_map<std::string, Client> GetClients() override;
  size_t                                   GetClientsCount() override;
  std::optional<Client>                    DeleteClient(const std::string& client_id) override;

  void Close() override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
  GenericStore                    generic_;
};

} // namespace msgstore::stores::memory
