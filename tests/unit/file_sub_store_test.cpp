#include "internal/stores/file/file_sub_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using msgstore::stores::RecoveredSubState;
using msgstore::stores::SubStoreLimits;
using msgstore::stores::file::Crc32Table;
using msgstore::stores::file::FileStoreOptions;
using msgstore::stores::file::FileSubStore;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "msgstore_file_sub_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::unique_ptr<FileSubStore> OpenStore(const std::filesystem::path& dir, const FileStoreOptions& opts, bool recover,
                                        const SubStoreLimits& limits = {}) {
  return std::make_unique<FileSubStore>(dir, "foo", limits, opts, std::make_shared<const Crc32Table>(), recover, nullptr);
}

FileStoreOptions CompactingOptions(bool enabled) {
  FileStoreOptions opts;
  opts.do_sync               = false;
  opts.compact_enabled       = enabled;
  opts.compact_interval      = std::chrono::seconds(0);
  opts.compact_min_file_size = 0;
  opts.compact_fragmentation = 50;
  return opts;
}

// Four subscriptions with three pending messages each, then acks and a
// delete that push the fragmentation above 50%.
void RunWorkload(FileSubStore& ss) {
  for (int i = 0; i < 4; ++i) {
    msgstore::v1::SubState sub;
    sub.set_client_id("client" + std::to_string(i));
    sub.set_inbox("inbox." + std::to_string(i));
    ss.CreateSub(sub);
    assert(sub.id() == static_cast<uint64_t>(i + 1));
    for (uint64_t seq = 1; seq <= 3; ++seq) {
      ss.AddSeqPending(sub.id(), seq);
    }
  }
  for (uint64_t id = 1; id <= 2; ++id) {
    for (uint64_t seq = 1; seq <= 3; ++seq) {
      ss.AckSeqPending(id, seq);
    }
  }
  ss.DeleteSub(3);
}

std::map<uint64_t, RecoveredSubState> ById(const std::vector<RecoveredSubState>& subs) {
  std::map<uint64_t, RecoveredSubState> result;
  for (const auto& s : subs) {
    result[s.sub.id()] = s;
  }
  return result;
}

void AssertSameState(const std::vector<RecoveredSubState>& a, const std::vector<RecoveredSubState>& b) {
  const auto ma = ById(a);
  const auto mb = ById(b);
  assert(ma.size() == mb.size());
  for (const auto& [id, s] : ma) {
    auto it = mb.find(id);
    assert(it != mb.end());
    assert(s.sub.client_id() == it->second.sub.client_id());
    assert(s.sub.inbox() == it->second.sub.inbox());
    assert(s.sub.last_sent() == it->second.sub.last_sent());
    assert(s.pending == it->second.pending);
  }
}

void TestCompactionShrinksFileAndKeepsState() {
  const auto plain_dir     = FreshDir("plain");
  const auto compacted_dir = FreshDir("compacted");

  std::vector<RecoveredSubState> expected;
  {
    auto ss = OpenStore(plain_dir, CompactingOptions(false), false);
    RunWorkload(*ss);
    expected = ss->Subscriptions();
    ss->Close();
  }
  {
    auto ss = OpenStore(compacted_dir, CompactingOptions(true), false);
    RunWorkload(*ss);
    AssertSameState(expected, ss->Subscriptions());
    ss->Close();
  }

  const auto plain_size     = std::filesystem::file_size(plain_dir / "subs.dat");
  const auto compacted_size = std::filesystem::file_size(compacted_dir / "subs.dat");
  assert(compacted_size < plain_size);

  // Live state survives a restart of both files.
  auto plain     = OpenStore(plain_dir, CompactingOptions(false), true);
  auto compacted = OpenStore(compacted_dir, CompactingOptions(false), true);
  AssertSameState(expected, plain->Subscriptions());
  AssertSameState(expected, compacted->Subscriptions());

  const auto subs = ById(compacted->Subscriptions());
  assert(subs.size() == 3);
  assert(subs.count(3) == 0);
  assert(subs.at(1).pending.empty());
  assert(subs.at(4).pending.size() == 3);
  assert(subs.at(4).sub.last_sent() == 3);

  // IDs are not reused after recovery.
  msgstore::v1::SubState sub;
  compacted->CreateSub(sub);
  assert(sub.id() == 5);
}

// Deletes the highest subscription, then acks until the file gets compacted.
void RunDeleteHighestWorkload(FileSubStore& ss) {
  for (int i = 0; i < 4; ++i) {
    msgstore::v1::SubState sub;
    sub.set_client_id("client" + std::to_string(i));
    ss.CreateSub(sub);
    for (uint64_t seq = 1; seq <= 3; ++seq) {
      ss.AddSeqPending(sub.id(), seq);
    }
  }
  ss.DeleteSub(4);
  for (uint64_t seq = 1; seq <= 3; ++seq) {
    ss.AckSeqPending(1, seq);
  }
  ss.AckSeqPending(2, 1);
}

void TestHighestIDSurvivesCompaction() {
  const auto plain_dir     = FreshDir("highest_plain");
  const auto compacted_dir = FreshDir("highest_compacted");
  {
    auto ss = OpenStore(plain_dir, CompactingOptions(false), false);
    RunDeleteHighestWorkload(*ss);
    ss->Close();
  }
  {
    auto ss = OpenStore(compacted_dir, CompactingOptions(true), false);
    RunDeleteHighestWorkload(*ss);
    ss->Close();
  }
  assert(std::filesystem::file_size(compacted_dir / "subs.dat") < std::filesystem::file_size(plain_dir / "subs.dat"));

  auto ss   = OpenStore(compacted_dir, CompactingOptions(false), true);
  auto subs = ById(ss->Subscriptions());
  assert(subs.size() == 3);
  assert(subs.count(4) == 0);
  assert(subs.at(2).pending.size() == 2);

  msgstore::v1::SubState sub;
  ss->CreateSub(sub);
  assert(sub.id() == 5);
  ss->Close();

  // And again once the new subscription is gone and the file compacted.
  {
    auto opts                  = CompactingOptions(true);
    opts.compact_fragmentation = 10;
    auto again                 = OpenStore(compacted_dir, opts, true);
    again->DeleteSub(5);
    again->Close();
  }
  auto last = OpenStore(compacted_dir, CompactingOptions(false), true);
  msgstore::v1::SubState next;
  last->CreateSub(next);
  assert(next.id() == 6);
}

void TestWritesAfterCompaction() {
  const auto dir = FreshDir("after_compaction");
  {
    auto ss = OpenStore(dir, CompactingOptions(true), false);
    RunWorkload(*ss);
    msgstore::v1::SubState upd;
    upd.set_id(4);
    upd.set_client_id("client3");
    upd.set_durable_name("durable");
    upd.set_is_durable(true);
    ss->UpdateSub(upd);
    ss->AckSeqPending(4, 2);
    ss->Close();
  }
  auto ss   = OpenStore(dir, CompactingOptions(false), true);
  auto subs = ById(ss->Subscriptions());
  assert(subs.at(4).sub.durable_name() == "durable");
  assert(subs.at(4).pending.size() == 2);
  assert(subs.at(4).pending.count(2) == 0);
}

void TestUpdateOfUnknownSubscriptionRegistersIt() {
  const auto dir = FreshDir("unknown_update");
  auto       ss  = OpenStore(dir, CompactingOptions(false), false);

  msgstore::v1::SubState upd;
  upd.set_id(10);
  upd.set_client_id("me");
  ss->UpdateSub(upd);

  msgstore::v1::SubState sub;
  ss->CreateSub(sub);
  assert(sub.id() == 11);
  assert(ss->Subscriptions().size() == 2);
}

void TestSubscriptionsLimit() {
  const auto     dir = FreshDir("limit");
  SubStoreLimits limits;
  limits.max_subscriptions = 1;
  auto ss                  = OpenStore(dir, CompactingOptions(false), false, limits);

  msgstore::v1::SubState a, b;
  ss->CreateSub(a);
  bool threw = false;
  try {
    ss->CreateSub(b);
  } catch (const msgstore::util::TooManySubs&) {
    threw = true;
  }
  assert(threw);
}

void TestClosedStoreRejectsWrites() {
  const auto dir = FreshDir("closed");
  auto       ss  = OpenStore(dir, CompactingOptions(false), false);
  ss->Close();
  ss->Close();

  bool threw = false;
  try {
    ss->AddSeqPending(1, 1);
  } catch (const msgstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCompactionShrinksFileAndKeepsState();
  TestHighestIDSurvivesCompaction();
  TestWritesAfterCompaction();
  TestUpdateOfUnknownSubscriptionRegistersIt();
  TestSubscriptionsLimit();
  TestClosedStoreRejectsWrites();

  std::cout << "msgstore_unit_file_sub_store: pass\n";
  return 0;
}
