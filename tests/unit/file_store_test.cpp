#include "internal/stores/file/file_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include "internal/stores/file/file_sub_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace msgstore::stores::file;
using msgstore::stores::DefaultStoreLimits;
using msgstore::stores::StoreLimits;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "msgstore_file_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  return dir;
}

msgstore::v1::ServerInfo Info(const std::string& cluster_id) {
  msgstore::v1::ServerInfo info;
  info.set_cluster_id(cluster_id);
  info.set_discovery("_STAN.discover." + cluster_id);
  return info;
}

void AppendBytes(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  out << bytes;
}

void TestFreshStoreHasNoState() {
  const auto dir = FreshDir("fresh");
  auto [store, recovered] = FileStore::Open(dir, DefaultStoreLimits(), {DoSync(false)});
  assert(!recovered.has_value());
  assert(store->Name() == "FILE");
  assert(std::filesystem::exists(dir / "server.dat"));
  assert(std::filesystem::exists(dir / "clients.dat"));
  store->Close();

  // Still nothing until Init() is called.
  auto [again, again_recovered] = FileStore::Open(dir);
  assert(!again_recovered.has_value());
}

void TestOrdersScenarioAndRecovery() {
  const auto dir = FreshDir("orders");
  int64_t    ts2 = 0;
  {
    auto [store, recovered] = FileStore::Open(dir, DefaultStoreLimits(), {DoSync(false)});
    store->Init(Info("first"));
    // The latest one wins.
    store->Init(Info("test-cluster"));

    store->AddClient("alice", "hb.alice", {});
    store->AddClient("bob", "hb.bob", {});

    auto [cs, created] = store->CreateChannel("orders", {});
    assert(created);
    assert(std::filesystem::is_directory(dir / "orders"));
    assert(cs->msgs->Store("a") == 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    assert(cs->msgs->Store("b") == 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    assert(cs->msgs->Store("c") == 3);

    assert(cs->msgs->FirstMsg()->data() == "a");
    assert(cs->msgs->LastMsg()->data() == "c");
    ts2 = cs->msgs->Lookup(2)->timestamp();
    assert(cs->msgs->GetSequenceFromTimestamp(ts2) == 2);

    msgstore::v1::SubState sub;
    sub.set_client_id("alice");
    sub.set_durable_name("dur");
    cs->subs->CreateSub(sub);
    cs->subs->AddSeqPending(sub.id(), 3);

    store->Close();
    store->Close();
  }

  auto [store, recovered] = FileStore::Open(dir, DefaultStoreLimits(), {DoSync(false)});
  assert(recovered.has_value());
  assert(recovered->info.cluster_id() == "test-cluster");
  assert(recovered->clients.size() == 2);
  assert(store->GetClientsCount() == 2);
  assert(store->GetClient("bob")->info.hb_inbox() == "hb.bob");

  assert(recovered->subs.count("orders") == 1);
  const auto& subs = recovered->subs.at("orders");
  assert(subs.size() == 1);
  assert(subs[0].sub.durable_name() == "dur");
  assert(subs[0].pending.count(3) == 1);

  auto* cs = store->LookupChannel("orders");
  assert(cs != nullptr);
  auto [first, last] = cs->msgs->FirstAndLastSequence();
  assert(first == 1 && last == 3);
  assert(cs->msgs->Lookup(2)->data() == "b");
  assert(cs->msgs->GetSequenceFromTimestamp(ts2) == 2);
  assert(store->MsgsState("orders").count == 3);

  // Existing channel is returned as is.
  auto [same, created] = store->CreateChannel("orders", {});
  assert(!created && same == cs);
  assert(cs->msgs->Store("d") == 4);
}

void TestClientsFileCompaction() {
  const auto plain_dir     = FreshDir("clients_plain");
  const auto compacted_dir = FreshDir("clients_compacted");

  auto workload = [](const std::filesystem::path& dir, bool compact) {
    auto [store, recovered] = FileStore::Open(
        dir, DefaultStoreLimits(),
        {DoSync(false), CompactEnabled(compact), CompactMinFileSize(0), CompactInterval(0), CompactFragmentation(50)});
    store->Init(Info("clients"));
    for (int i = 0; i < 10; ++i) {
      store->AddClient("client" + std::to_string(i), "hb", {});
    }
    for (int i = 0; i < 6; ++i) {
      assert(store->DeleteClient("client" + std::to_string(i)).has_value());
    }
    assert(store->GetClientsCount() == 4);
    store->Close();
  };
  workload(plain_dir, false);
  workload(compacted_dir, true);

  assert(std::filesystem::file_size(compacted_dir / "clients.dat") < std::filesystem::file_size(plain_dir / "clients.dat"));

  for (const auto& dir : {plain_dir, compacted_dir}) {
    auto [store, recovered] = FileStore::Open(dir);
    assert(recovered.has_value());
    assert(recovered->clients.size() == 4);
    assert(!store->GetClient("client0").has_value());
    assert(store->GetClient("client9").has_value());
  }
}

void TestServerFileSizeIsChecked() {
  const auto dir = FreshDir("server_size");
  {
    auto [store, recovered] = FileStore::Open(dir, DefaultStoreLimits(), {DoSync(false)});
    store->Init(Info("size"));
  }
  AppendBytes(dir / "server.dat", "garbage");

  bool threw = false;
  try {
    (void)FileStore::Open(dir);
  } catch (const msgstore::util::Corruption& e) {
    threw = std::string(e.what()).find("incorrect file size") != std::string::npos;
  }
  assert(threw);
}

void TestInvalidClientRecordType() {
  const auto dir = FreshDir("client_type");
  {
    auto [store, recovered] = FileStore::Open(dir, DefaultStoreLimits(), {DoSync(false)});
    store->Init(Info("types"));
  }
  // Empty record of type 9, the CRC of no bytes is 0.
  AppendBytes(dir / "clients.dat", std::string("\x00\x00\x00\x09\x00\x00\x00\x00", 8));

  bool threw = false;
  try {
    (void)FileStore::Open(dir);
  } catch (const msgstore::util::Corruption& e) {
    threw = std::string(e.what()).find("invalid client record type: 9") != std::string::npos;
  }
  assert(threw);
}

void TestChannelLimit() {
  const auto  dir = FreshDir("channel_limit");
  StoreLimits limits;
  limits.max_channels = 1;
  auto [store, recovered] = FileStore::Open(dir, limits, {DoSync(false)});
  store->CreateChannel("a", {});
  bool threw = false;
  try {
    store->CreateChannel("b", {});
  } catch (const msgstore::util::TooManyChannels&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(dir / "b"));
}

void TestOptionsAndClosedStore() {
  const auto dir   = FreshDir("options");
  bool       threw = false;
  try {
    (void)FileStore::Open(dir, DefaultStoreLimits(), {BufferSize(-1)});
  } catch (const msgstore::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);

  auto [store, recovered] = FileStore::Open(dir, DefaultStoreLimits(), {DoSync(false), DoCRC(false), SliceConfig(100, 0, std::chrono::seconds(0), "")});
  assert(!store->options().do_crc);
  assert(store->options().slice_max_msgs == 100);
  store->Close();

  threw = false;
  try {
    store->Init(Info("closed"));
  } catch (const msgstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFreshStoreHasNoState();
  TestOrdersScenarioAndRecovery();
  TestClientsFileCompaction();
  TestServerFileSizeIsChecked();
  TestInvalidClientRecordType();
  TestChannelLimit();
  TestOptionsAndClosedStore();

  std::cout << "msgstore_unit_file_store: pass\n";
  return 0;
}
