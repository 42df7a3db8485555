#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "msgstore/v1.hpp"

namespace {

using msgstore::stores::ChannelLimits;
using msgstore::v1::Store;
using msgstore::v1::StoreLimits;

struct BackendFactory {
  std::string                                               name;
  std::function<std::unique_ptr<Store>(const StoreLimits&)> make_store;
  std::function<void()>                                     cleanup;
};

std::filesystem::path ParityDir() {
  return std::filesystem::temp_directory_path() / "msgstore_store_parity_tests";
}

StoreLimits ParityLimits() {
  StoreLimits limits;
  limits.max_channels                   = 3;
  limits.channel.msgs.max_msgs          = 5;
  limits.channel.subs.max_subscriptions = 3;
  ChannelLimits small;
  small.msgs.max_msgs         = 2;
  limits.per_channel["small"] = small;
  return limits;
}

void VerifyOrders(Store& store) {
  auto [cs, created] = store.CreateChannel("orders", {});
  assert(created);

  assert(cs->msgs->Store("a") == 1);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  assert(cs->msgs->Store("b") == 2);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  assert(cs->msgs->Store("c") == 3);

  assert(cs->msgs->FirstMsg()->data() == "a");
  assert(cs->msgs->LastMsg()->data() == "c");
  assert(cs->msgs->Lookup(2)->subject() == "orders");
  assert(cs->msgs->GetSequenceFromTimestamp(cs->msgs->Lookup(2)->timestamp()) == 2);
  assert(cs->msgs->Lookup(99) == nullptr);
}

void VerifyLimits(Store& store) {
  // Global count limit.
  auto* cs = store.CreateChannel("big", {}).first;
  for (int i = 0; i < 8; ++i) {
    cs->msgs->Store("m");
  }
  auto [first, last] = cs->msgs->FirstAndLastSequence();
  assert(first == 4 && last == 8);
  assert(cs->msgs->State().count == 5);

  // Per channel override.
  auto* small = store.CreateChannel("small", {}).first;
  for (int i = 0; i < 4; ++i) {
    small->msgs->Store("s");
  }
  assert(small->msgs->State().count == 2);
  assert(small->msgs->FirstSequence() == 3);

  // orders + big + small.
  bool threw = false;
  try {
    store.CreateChannel("fourth", {});
  } catch (const msgstore::util::TooManyChannels&) {
    threw = true;
  }
  assert(threw);
  assert(store.LookupChannel("fourth") == nullptr);

  auto*                  subs = cs->subs.get();
  msgstore::v1::SubState s;
  for (int i = 0; i < 3; ++i) {
    s.clear_id();
    subs->CreateSub(s);
  }
  threw = false;
  try {
    subs->CreateSub(s);
  } catch (const msgstore::util::TooManySubs&) {
    threw = true;
  }
  assert(threw);
}

void VerifySubscriptionIds(Store& store) {
  auto* subs = store.LookupChannel("orders")->subs.get();

  msgstore::v1::SubState a, b;
  subs->CreateSub(a);
  subs->CreateSub(b);
  assert(b.id() == a.id() + 1);

  // An update for an ID never seen bumps the next ID.
  msgstore::v1::SubState ghost;
  ghost.set_id(b.id() + 10);
  subs->UpdateSub(ghost);
  subs->DeleteSub(ghost.id());

  msgstore::v1::SubState c;
  subs->CreateSub(c);
  assert(c.id() == ghost.id() + 1);

  subs->AddSeqPending(a.id(), 1);
  subs->AckSeqPending(a.id(), 1);
  // Unknown subscription is not an error.
  subs->AckSeqPending(999, 1);
  subs->Flush();
}

void VerifyClients(Store& store) {
  auto [c, added] = store.AddClient("me", "hb.me", std::string("data"));
  assert(added);
  auto [dup, dup_added] = store.AddClient("me", "hb.other", {});
  assert(!dup_added);
  assert(dup.info.hb_inbox() == "hb.me");
  assert(std::any_cast<std::string>(dup.user_data) == "data");

  store.AddClient("other", "hb.other", {});
  assert(store.GetClientsCount() == 2);
  assert(store.GetClients().size() == 2);

  auto deleted = store.DeleteClient("me");
  assert(deleted && deleted->info.id() == "me");
  assert(!store.GetClient("me").has_value());
  assert(!store.DeleteClient("me").has_value());
}

void VerifyStats(Store& store) {
  assert(store.HasChannel());
  const auto all    = store.MsgsState(msgstore::stores::kAllChannels);
  const auto orders = store.MsgsState("orders");
  const auto big    = store.MsgsState("big");
  const auto small  = store.MsgsState("small");
  assert(orders.count == 3 && big.count == 5 && small.count == 2);
  assert(all.count == 10);
  assert(all.bytes == orders.bytes + big.bytes + small.bytes);
  assert(store.MsgsState("nope").count == 0);
}

// Channels stay registered after Close() but their stores refuse writes.
void VerifyClosedStoreRejectsWrites(Store& store) {
  msgstore::v1::ChannelStore* cs = store.LookupChannel("orders");
  assert(cs != nullptr);

  bool threw = false;
  try {
    cs->msgs->Store("late");
  } catch (const msgstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    msgstore::v1::SubState sub;
    cs->subs->CreateSub(sub);
  } catch (const msgstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(cs->msgs->State().count == 3);
}

void RunParity(const BackendFactory& factory) {
  factory.cleanup();
  auto store = factory.make_store(ParityLimits());
  assert(!store->HasChannel());

  VerifyOrders(*store);
  VerifyLimits(*store);
  VerifySubscriptionIds(*store);
  VerifyClients(*store);
  VerifyStats(*store);

  store->Close();
  store->Close();
  VerifyClosedStoreRejectsWrites(*store);
  factory.cleanup();
  std::cout << "  parity ok: " << factory.name << "\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> factories;
  factories.push_back({"memory",
                       [](const StoreLimits& limits) { return std::make_unique<msgstore::stores::memory::MemoryStore>(limits); },
                       [] {}});
  factories.push_back({"file",
                       [](const StoreLimits& limits) -> std::unique_ptr<Store> {
                         auto [store, recovered] = msgstore::stores::file::FileStore::Open(
                             ParityDir(), limits, {msgstore::stores::file::DoSync(false), msgstore::stores::file::SliceConfig(2, 0, std::chrono::seconds(0), "")});
                         assert(!recovered.has_value());
                         return std::move(store);
                       },
                       [] { std::filesystem::remove_all(ParityDir()); }});

  for (const auto& factory : factories) {
    RunParity(factory);
  }

  std::cout << "msgstore_integration_store_parity: pass\n";
  return 0;
}
