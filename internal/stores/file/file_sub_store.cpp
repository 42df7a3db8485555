#include "file_sub_store.hpp"

#include <arrow/io/buffered.h>
#include <arrow/memory_pool.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/stores/file/file_io.hpp"
#include "internal/util/errors.hpp"

namespace msgstore::stores::file {

using namespace msgstore::observability;

namespace {

constexpr const char* kSubsFileName = "subs.dat";

// The write buffer never shrinks below this.
constexpr int64_t kSubBufMinShrinkSize = 128;

template <typename T>
T ParseRecord(const std::vector<uint8_t>& buf, uint32_t size) {
  T rec;
  if (!rec.ParseFromArray(buf.data(), static_cast<int>(size))) {
    throw util::Corruption(fmt::format("unable to parse {} record", rec.GetTypeName()));
  }
  return rec;
}

} // namespace

FileSubStore::FileSubStore(std::filesystem::path dir, std::string subject, const SubStoreLimits& limits,
                           const FileStoreOptions& opts, std::shared_ptr<const Crc32Table> crc_table, bool recover,
                           std::shared_ptr<spdlog::logger> logger)
    : dir_(std::move(dir)),
      file_path_(dir_ / kSubsFileName),
      opts_(opts),
      crc_(std::move(crc_table)),
      logger_(ResolveLogger(std::move(logger))) {
  log_.subject = std::move(subject);
  log_.limits  = limits;

  try {
    file_ = OpenFile(file_path_);
    if (opts_.buffer_size > 0) {
      bw_ = std::make_unique<BufferedWriter>(kSubBufMinShrinkSize, opts_.buffer_size);
    }
    SetWriter();
    if (recover) {
      Recover();
    }
  } catch (const std::exception&) {
    if (bw_) {
      bw_->Release();
    }
    writer_.reset();
    if (file_) {
      auto status = file_->Close();
      if (!status.ok()) {
        Log(*logger_, spdlog::level::warn, "failed to close subscriptions file", {StringField("channel", log_.subject), StringField("error", status.ToString())});
      }
    }
    RethrowWithContext(fmt::format("unable to {} subscription store for [{}]: ", recover ? "recover" : "create", log_.subject));
  }

  // Not worth shrinking below the minimum.
  if (opts_.buffer_size > kSubBufMinShrinkSize) {
    shrink_timer_ = std::thread(&FileSubStore::RunShrinkTimer, this);
  }
}

FileSubStore::~FileSubStore() {
  try {
    Close();
  } catch (const std::exception& e) {
    Log(*logger_, spdlog::level::err, "failed to close subscription store", {StringField("channel", log_.subject), StringField("error", e.what())});
  }
}

void FileSubStore::SetWriter() {
  writer_ = file_;
  if (bw_) {
    writer_ = bw_->CreateNewWriter(file_);
  }
}

void FileSubStore::Recover() {
  auto in = OpenReader(file_path_, kDefaultBufSize);

  while (auto rec = ReadRecord(*in, tmp_buf_, true, *crc_, opts_.do_crc)) {
    file_size_ += rec->size + kRecordHeaderSize;

    switch (rec->type) {
      case kSubRecNew: {
        auto sub = ParseRecord<v1::SubState>(tmp_buf_, rec->size);
        const uint64_t id = sub.id();
        subs_[id]         = Subscription{std::move(sub), {}};
        log_.subs_count++;
        log_.max_sub_id = std::max(log_.max_sub_id, id);
        num_recs_++;
        break;
      }
      case kSubRecUpdate: {
        auto sub = ParseRecord<v1::SubState>(tmp_buf_, rec->size);
        const uint64_t id = sub.id();
        auto [it, inserted] = subs_.try_emplace(id);
        it->second.sub      = std::move(sub);
        if (inserted) {
          log_.subs_count++;
        } else {
          // The previous version is free space.
          del_recs_++;
        }
        log_.max_sub_id = std::max(log_.max_sub_id, id);
        num_recs_++;
        break;
      }
      case kSubRecDel: {
        auto del = ParseRecord<v1::SubStateDelete>(tmp_buf_, rec->size);
        if (auto it = subs_.find(del.id()); it != subs_.end()) {
          del_recs_ += 1 + static_cast<int64_t>(it->second.seqnos.size());
          subs_.erase(it);
          log_.subs_count--;
        }
        log_.max_sub_id = std::max(log_.max_sub_id, del.id());
        break;
      }
      case kSubRecMsg: {
        auto upd = ParseRecord<v1::SubStateUpdate>(tmp_buf_, rec->size);
        if (auto it = subs_.find(upd.id()); it != subs_.end()) {
          // The same seqno may show up several times (redeliveries).
          if (upd.seqno() > it->second.sub.last_sent()) {
            it->second.sub.set_last_sent(upd.seqno());
          }
          it->second.seqnos.insert(upd.seqno());
          num_recs_++;
        }
        break;
      }
      case kSubRecAck: {
        auto upd = ParseRecord<v1::SubStateUpdate>(tmp_buf_, rec->size);
        if (auto it = subs_.find(upd.id()); it != subs_.end()) {
          it->second.seqnos.erase(upd.seqno());
          del_recs_++;
        }
        break;
      }
      default:
        throw util::Corruption(fmt::format("unexpected record type: {}", rec->type));
    }
  }
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

// Lock held on entry.
void FileSubStore::WriteSubRecord(RecordType type, const google::protobuf::MessageLite& rec) {
  if (log_.closed) {
    throw util::InvalidState(fmt::format("subscription store for [{}] is closed", log_.subject));
  }
  const bool use_buffer = bw_ && bw_->active();
  if (use_buffer && bw_->buf_size() != bw_->max_size()) {
    const int64_t required = static_cast<int64_t>(rec.ByteSizeLong()) + kRecordHeaderSize;
    if (required > bw_->Available()) {
      bw_->Expand(required);
    }
  }
  Append(*writer_, type, rec);
  if (use_buffer && bw_->shrink_requested()) {
    bw_->CheckShrinkRequest();
  }
  activity_ = true;
}

// Lock held on entry. Writes the record and updates the compaction accounting.
int64_t FileSubStore::Append(arrow::io::OutputStream& out, RecordType type, const google::protobuf::MessageLite& rec) {
  const int64_t size = WriteRecord(out, tmp_buf_, type, rec, *crc_);
  switch (type) {
    case kSubRecNew:
    case kSubRecMsg:
      num_recs_++;
      break;
    case kSubRecAck:
    case kSubRecDel:
      del_recs_++;
      break;
    case kSubRecUpdate:
      // The old version becomes free space.
      num_recs_++;
      del_recs_++;
      break;
    default:
      throw util::InvalidState(fmt::format("unknown subscription record type {}", type));
  }
  file_size_ += size;
  return size;
}

void FileSubStore::CreateSub(v1::SubState& sub) {
  std::unique_lock lock(mutex_);
  log_.AssignID(sub);
  try {
    WriteSubRecord(kSubRecNew, sub);
  } catch (const std::exception&) {
    // The ID stays used, only the count is given back.
    log_.subs_count--;
    throw;
  }
  subs_[sub.id()] = Subscription{sub, {}};
}

void FileSubStore::UpdateSub(const v1::SubState& sub) {
  std::unique_lock lock(mutex_);
  WriteSubRecord(kSubRecUpdate, sub);
  auto [it, inserted] = subs_.try_emplace(sub.id());
  it->second.sub      = sub;
  if (inserted) {
    log_.subs_count++;
    log_.max_sub_id = std::max(log_.max_sub_id, sub.id());
  }
}

void FileSubStore::DeleteSub(uint64_t sub_id) {
  std::unique_lock lock(mutex_);
  v1::SubStateDelete del;
  del.set_id(sub_id);
  WriteSubRecord(kSubRecDel, del);

  auto it = subs_.find(sub_id);
  if (it == subs_.end()) {
    return;
  }
  // The delete record is already counted, add the pending messages.
  del_recs_ += static_cast<int64_t>(it->second.seqnos.size());
  subs_.erase(it);
  log_.subs_count--;
  TryCompact();
}

void FileSubStore::AddSeqPending(uint64_t sub_id, uint64_t seqno) {
  std::unique_lock lock(mutex_);
  v1::SubStateUpdate upd;
  upd.set_id(sub_id);
  upd.set_seqno(seqno);
  WriteSubRecord(kSubRecMsg, upd);

  if (auto it = subs_.find(sub_id); it != subs_.end()) {
    if (seqno > it->second.sub.last_sent()) {
      it->second.sub.set_last_sent(seqno);
    }
    it->second.seqnos.insert(seqno);
  }
}

void FileSubStore::AckSeqPending(uint64_t sub_id, uint64_t seqno) {
  std::unique_lock lock(mutex_);
  v1::SubStateUpdate upd;
  upd.set_id(sub_id);
  upd.set_seqno(seqno);
  WriteSubRecord(kSubRecAck, upd);

  if (auto it = subs_.find(sub_id); it != subs_.end()) {
    it->second.seqnos.erase(seqno);
    TryCompact();
  }
}

std::vector<RecoveredSubState> FileSubStore::Subscriptions() const {
  std::shared_lock lock(mutex_);
  std::vector<RecoveredSubState> result;
  result.reserve(subs_.size());
  for (const auto& [id, s] : subs_) {
    result.push_back(RecoveredSubState{s.sub, s.seqnos});
  }
  return result;
}

// ------------------------------------------------------------
// Compaction
// ------------------------------------------------------------

// Lock held on entry.
bool FileSubStore::ShouldCompact() const {
  if (!opts_.compact_enabled) {
    return false;
  }
  if (opts_.compact_min_file_size > 0 && file_size_ < opts_.compact_min_file_size) {
    return false;
  }
  const int64_t frag = num_recs_ == 0 ? 100 : del_recs_ * 100 / num_recs_;
  if (frag < opts_.compact_fragmentation) {
    return false;
  }
  return util::Now() - compact_ts_ >= opts_.compact_interval;
}

// Lock held on entry. A failed compaction leaves the current file in use.
void FileSubStore::TryCompact() {
  if (!ShouldCompact()) {
    return;
  }
  try {
    Compact();
  } catch (const std::exception& e) {
    Log(*logger_, spdlog::level::err, "subscriptions file compaction failed", {StringField("channel", log_.subject), StringField("error", e.what())});
  }
}

// Lock held on entry.
void FileSubStore::Compact() {
  TempFile tmp = CreateTempFile(dir_, "subs");

  const int64_t saved_num_recs  = num_recs_;
  const int64_t saved_del_recs  = del_recs_;
  const int64_t saved_file_size = file_size_;
  // Append() recomputes them from the live state.
  num_recs_  = 0;
  del_recs_  = 0;
  file_size_ = 0;

  try {
    {
      auto out = Unwrap(arrow::io::BufferedOutputStream::Create(kDefaultBufSize, arrow::default_memory_pool(), tmp.stream));
      for (const auto& [id, s] : subs_) {
        Append(*out, kSubRecNew, s.sub);
        v1::SubStateUpdate upd;
        upd.set_id(id);
        for (uint64_t seqno : s.seqnos) {
          upd.set_seqno(seqno);
          Append(*out, kSubRecMsg, upd);
        }
      }
      // Keep the highest ID ever assigned so that it is not reused after a
      // restart. It is not free space to reclaim.
      const uint64_t max_live_id = subs_.empty() ? 0 : subs_.rbegin()->first;
      if (log_.max_sub_id > max_live_id) {
        v1::SubStateDelete del;
        del.set_id(log_.max_sub_id);
        file_size_ += WriteRecord(*out, tmp_buf_, kSubRecDel, del, *crc_);
      }
      Unwrap(out->Detach());
    }
    SyncFile(*tmp.stream);

    if (bw_) {
      bw_->Release();
    }
    writer_.reset();
    SwapFiles(tmp, file_path_, file_);
  } catch (const std::exception&) {
    num_recs_  = saved_num_recs;
    del_recs_  = saved_del_recs;
    file_size_ = saved_file_size;

    auto status = tmp.stream->Close();
    if (!status.ok()) {
      Log(*logger_, spdlog::level::warn, "failed to close temporary file", {StringField("file", tmp.path.string()), StringField("error", status.ToString())});
    }
    std::error_code ec;
    std::filesystem::remove(tmp.path, ec);
    if (!writer_) {
      SetWriter();
    }
    throw;
  }
  SetWriter();
  compact_ts_ = util::Now();
}

// ------------------------------------------------------------
// Flush / Close
// ------------------------------------------------------------

// Lock held on entry.
void FileSubStore::FlushLocked() {
  if (!activity_) {
    return;
  }
  activity_ = false;
  if (bw_) {
    bw_->Flush();
  }
  if (opts_.do_sync) {
    SyncFile(*file_);
  }
}

void FileSubStore::Flush() {
  std::unique_lock lock(mutex_);
  if (log_.closed) {
    return;
  }
  FlushLocked();
}

void FileSubStore::Close() {
  std::exception_ptr first;
  {
    std::unique_lock lock(mutex_);
    if (log_.closed) {
      return;
    }
    log_.closed = true;

    if (file_) {
      util::CaptureFirstError(first, [&] { FlushLocked(); });
      if (bw_) {
        util::CaptureFirstError(first, [&] { bw_->Release(); });
      }
      writer_.reset();
      util::CaptureFirstError(first, [&] { Unwrap(file_->Close()); });
    }
  }
  shrink_cv_.notify_all();
  if (shrink_timer_.joinable()) {
    shrink_timer_.join();
  }
  if (first) {
    std::rethrow_exception(first);
  }
}

void FileSubStore::RunShrinkTimer() {
  std::unique_lock lock(mutex_);
  while (!log_.closed) {
    shrink_cv_.wait_for(lock, kBufShrinkInterval, [this] { return log_.closed; });
    if (log_.closed) {
      break;
    }
    try {
      bw_->TryShrinkBuffer();
    } catch (const std::exception& e) {
      // The next flush reports the failure to the caller.
      Log(*logger_, spdlog::level::warn, "subscriptions buffer shrink failed", {StringField("channel", log_.subject), StringField("error", e.what())});
    }
  }
}

} // namespace msgstore::stores::file
