#include "generic_store.hpp"

#include <exception>
#include <mutex>

#include "internal/util/errors.hpp"

namespace msgstore::stores {

GenericStore::GenericStore(std::string name, const StoreLimits& limits) : name_(std::move(name)) {
  SetLimits(limits);
}

void GenericStore::SetLimits(const StoreLimits& limits) {
  // Build on a copy so a rejected value never replaces the current one.
  StoreLimits built = limits;
  built.Build();

  std::unique_lock lock(mutex_);
  state_.limits = std::move(built);
}

StoreLimits GenericStore::Limits() const {
  std::shared_lock lock(mutex_);
  return state_.limits;
}

std::pair<ChannelStore*, bool> GenericStore::CreateChannel(const std::string& channel, std::any user_data, const ChannelFactory& factory) {
  std::unique_lock lock(mutex_);

  auto it = state_.channels.find(channel);
  if (it != state_.channels.end()) {
    return {it->second.get(), false};
  }

  if (state_.limits.max_channels > 0 && static_cast<int64_t>(state_.channels.size()) >= state_.limits.max_channels) {
    throw util::TooManyChannels();
  }

  auto store       = factory(channel, state_.limits.ForChannel(channel));
  store->user_data = std::move(user_data);

  auto* raw = store.get();
  state_.channels.emplace(channel, std::move(store));
  return {raw, true};
}

ChannelStore* GenericStore::LookupChannel(const std::string& channel) const {
  std::shared_lock lock(mutex_);
  auto it = state_.channels.find(channel);
  return it == state_.channels.end() ? nullptr : it->second.get();
}

bool GenericStore::HasChannel() const {
  std::shared_lock lock(mutex_);
  return !state_.channels.empty();
}

MsgsStats GenericStore::MsgsState(const std::string& channel) const {
  MsgsStats total;

  std::shared_lock lock(mutex_);
  if (channel == kAllChannels) {
    for (const auto& [name, cs] : state_.channels) {
      auto stats = cs->msgs->State();
      total.count += stats.count;
      total.bytes += stats.bytes;
    }
    return total;
  }

  auto it = state_.channels.find(channel);
  if (it != state_.channels.end()) {
    total = it->second->msgs->State();
  }
  return total;
}

void GenericStore::AddRecoveredChannel(const std::string& channel, std::unique_ptr<ChannelStore> store) {
  std::unique_lock lock(mutex_);
  state_.channels[channel] = std::move(store);
}

std::pair<Client, bool> GenericStore::AddClient(const std::string& client_id, const std::string& hb_inbox, std::any user_data,
                                                const ClientHook& persist) {
  std::unique_lock lock(mutex_);

  auto it = state_.clients.find(client_id);
  if (it != state_.clients.end()) {
    return {it->second, false};
  }

  Client client;
  client.info.set_id(client_id);
  client.info.set_hb_inbox(hb_inbox);
  client.user_data = std::move(user_data);

  if (persist) {
    persist(client);
  }
  state_.clients.emplace(client_id, client);
  return {std::move(client), true};
}

std::optional<Client> GenericStore::GetClient(const std::string& client_id) const {
  std::shared_lock lock(mutex_);
  auto it = state_.clients.find(client_id);
  if (it == state_.clients.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::unordered_map<std::string, Client> GenericStore::GetClients() const {
  std::shared_lock lock(mutex_);
  return state_.clients;
}

size_t GenericStore::GetClientsCount() const {
  std::shared_lock lock(mutex_);
  return state_.clients.size();
}

std::optional<Client> GenericStore::DeleteClient(const std::string& client_id, const DeleteHook& persist) {
  std::unique_lock lock(mutex_);

  auto it = state_.clients.find(client_id);
  if (it == state_.clients.end()) {
    return std::nullopt;
  }
  Client client = std::move(it->second);
  state_.clients.erase(it);

  if (persist) {
    try {
      persist(client, state_.clients);
    } catch (...) {
      state_.clients.emplace(client_id, client);
      throw;
    }
  }
  return client;
}

void GenericStore::AddRecoveredClient(Client client) {
  std::unique_lock lock(mutex_);
  auto id = client.info.id();
  state_.clients[id] = std::move(client);
}

bool GenericStore::Close() {
  std::unique_lock lock(mutex_);
  if (state_.closed) {
    return false;
  }
  state_.closed = true;

  std::exception_ptr first_error;
  for (auto& [name, cs] : state_.channels) {
    util::CaptureFirstError(first_error, [&] { cs->subs->Close(); });
    util::CaptureFirstError(first_error, [&] { cs->msgs->Close(); });
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return true;
}

} // namespace msgstore::stores
