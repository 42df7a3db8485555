#include "memory_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/stores/memory/memory_msg_store.hpp"
#include "internal/stores/memory/memory_sub_store.hpp"

namespace msgstore::stores::memory {

using namespace msgstore::observability;

MemoryStore::MemoryStore(const StoreLimits& limits, std::shared_ptr<spdlog::logger> logger)
    : logger_(ResolveLogger(std::move(logger))), generic_(kTypeMemory, limits) {
}

MemoryStore::~MemoryStore() {
  try {
    Close();
  } catch (const std::exception& e) {
    Log(*logger_, spdlog::level::err, "failed to close memory store", {StringField("error", e.what())});
  }
}

void MemoryStore::Init(const v1::ServerInfo&) {
}

std::string MemoryStore::Name() const {
  return generic_.Name();
}

void MemoryStore::SetLimits(const StoreLimits& limits) {
  generic_.SetLimits(limits);
}

std::pair<ChannelStore*, bool> MemoryStore::CreateChannel(const std::string& channel, std::any user_data) {
  return generic_.CreateChannel(channel, std::move(user_data), [this](const std::string& name, const ChannelLimits& limits) {
    auto cs  = std::make_unique<ChannelStore>();
    cs->msgs = std::make_unique<MemoryMsgStore>(name, limits.msgs, logger_);
    cs->subs = std::make_unique<MemorySubStore>(name, limits.subs);
    return cs;
  });
}

ChannelStore* MemoryStore::LookupChannel(const std::string& channel) {
  return generic_.LookupChannel(channel);
}

bool MemoryStore::HasChannel() {
  return generic_.HasChannel();
}

MsgsStats MemoryStore::MsgsState(const std::string& channel) {
  return generic_.MsgsState(channel);
}

std::pair<Client, bool> MemoryStore::AddClient(const std::string& client_id, const std::string& hb_inbox, std::any user_data) {
  return generic_.AddClient(client_id, hb_inbox, std::move(user_data));
}

std::optional<Client> MemoryStore::GetClient(const std::string& client_id) {
  return generic_.GetClient(client_id);
}

std::unordered_map<std::string, Client> MemoryStore::GetClients() {
  return generic_.GetClients();
}

size_t MemoryStore::GetClientsCount() {
  return generic_.GetClientsCount();
}

std::optional<Client> MemoryStore::DeleteClient(const std::string& client_id) {
  return generic_.DeleteClient(client_id);
}

void MemoryStore::Close() {
  generic_.Close();
}

} // namespace msgstore::stores::memory
