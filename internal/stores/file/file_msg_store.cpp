#include "file_msg_store.hpp"

#include <arrow/io/buffered.h>
#include <arrow/memory_pool.h>
#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/stores/file/file_io.hpp"
#include "internal/stores/file/record_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace msgstore::stores::file {

using namespace msgstore::observability;

namespace {

constexpr const char* kMsgFilesPrefix = "msgs.";
constexpr const char* kDatSuffix      = ".dat";
constexpr const char* kIdxSuffix      = ".idx";
constexpr const char* kBakSuffix      = ".bak";

// The write buffer never shrinks below this.
constexpr int64_t kMsgBufMinShrinkSize = 512;

constexpr auto    kBkgTasksSleep    = std::chrono::seconds(1);
constexpr int64_t kSliceIdleNanos   = 1'000'000'000;
constexpr int64_t kBufShrinkNanos   = std::chrono::duration_cast<std::chrono::nanoseconds>(kBufShrinkInterval).count();
constexpr int64_t kMinSliceAgeNanos = 1'000'000'000;

std::filesystem::path SlicePath(const std::filesystem::path& dir, int64_t fseq, const char* suffix) {
  return dir / fmt::format("{}{}{}", kMsgFilesPrefix, fseq, suffix);
}

std::string ShellQuote(const std::string& arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

} // namespace

FileMsgStore::FileMsgStore(std::filesystem::path dir, std::string subject, const MsgStoreLimits& limits,
                           const FileStoreOptions& opts, std::shared_ptr<const Crc32Table> crc_table, bool recover,
                           std::shared_ptr<spdlog::logger> logger)
    : dir_(std::move(dir)), opts_(opts), crc_(std::move(crc_table)), logger_(ResolveLogger(std::move(logger))) {
  log_.subject = std::move(subject);
  log_.limits  = limits;

  SetSliceLimits();
  if (opts_.buffer_size > 0) {
    bw_ = std::make_unique<BufferedWriter>(kMsgBufMinShrinkSize, opts_.buffer_size);
  }

  try {
    if (recover) {
      Recover();
    }
    std::unique_lock lock(mutex_);
    time_tick_ = util::NowNanos();
    const int64_t max_age = log_.limits.max_age.count();
    // Expire what aged while the store was closed.
    if (recover && max_age > 0 && log_.total_count > 0) {
      ExpireMsgs(time_tick_, max_age);
    }
  } catch (const std::exception&) {
    CloseFilesQuietly();
    for (auto& archiver : archivers_) {
      archiver.thread.join();
    }
    RethrowWithContext(fmt::format("unable to {} message store for [{}]: ", recover ? "recover" : "create", log_.subject));
  }

  bkg_thread_ = std::thread(&FileMsgStore::RunBackgroundTasks, this);
}

FileMsgStore::~FileMsgStore() {
  try {
    Close();
  } catch (const std::exception& e) {
    Log(*logger_, spdlog::level::err, "failed to close message store", {StringField("channel", log_.subject), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Recovery
// ------------------------------------------------------------

void FileMsgStore::Recover() {
  const std::string prefix = kMsgFilesPrefix;
  const std::string suffix = kDatSuffix;

  for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    if (!name.starts_with(prefix) || !name.ends_with(suffix) || name.size() <= prefix.size() + suffix.size()) {
      continue;
    }
    const std::string number = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());

    int64_t    fseq = 0;
    const auto res  = std::from_chars(number.data(), number.data() + number.size(), fseq);
    if (res.ec != std::errc() || res.ptr != number.data() + number.size()) {
      throw util::Corruption("message log has an invalid name: " + name);
    }

    FileSlice slice;
    slice.dat_path = entry.path();
    slice.idx_path = SlicePath(dir_, fseq, kIdxSuffix);
    RecoverOneSlice(slice, fseq);
  }

  if (last_fslice_ > 0) {
    // Now that every slice is known, the last one becomes current.
    curr_slice_ = &files_.at(last_fslice_);
    OpenDataAndIndexFiles(*curr_slice_);
    w_offset_ = FileSize(curr_slice_->dat_path);
  }
  EnforceLimits(false);
}

void FileMsgStore::RecoverOneSlice(FileSlice& slice, int64_t fseq) {
  const bool use_idx = std::filesystem::exists(slice.idx_path);

  // Creates the index file if missing.
  OpenDataAndIndexFiles(slice);

  auto account = [&slice](uint64_t seq, uint32_t size, int64_t timestamp) {
    if (slice.first_seq == 0) {
      slice.first_seq = seq;
    }
    slice.last_seq = seq;
    slice.msgs_count++;
    slice.msgs_size += size + kMsgRecordOverhead;
    if (slice.first_write == 0) {
      slice.first_write = timestamp;
    }
  };

  if (use_idx) {
    auto    in = OpenReader(slice.idx_path, kDefaultBufSize);
    uint8_t buf[kMsgIndexRecSize];
    while (true) {
      const int64_t n = ReadFull(*in, buf, kMsgIndexRecSize);
      if (n == 0) {
        break;
      }
      if (n != kMsgIndexRecSize) {
        throw util::Corruption(fmt::format("truncated index record in {}", slice.idx_path.string()));
      }
      const MsgIndex idx = DecodeIndex(buf, *crc_, opts_.do_crc);
      msgs_[idx.seq]     = {idx.offset, idx.timestamp, idx.size};
      account(idx.seq, idx.size, idx.timestamp);
    }
  } else {
    // No index: scan the data file and rebuild the index as we go.
    try {
      auto in  = OpenReader(slice.dat_path, kDefaultBufSize);
      auto out = Unwrap(arrow::io::BufferedOutputStream::Create(kMsgIndexRecSize * 1000, arrow::default_memory_pool(), idx_file_));

      int64_t offset = 4;
      try {
        while (auto rec = ReadRecord(*in, tmp_buf_, false, *crc_, opts_.do_crc)) {
          v1::MsgProto msg;
          if (!msg.ParseFromArray(tmp_buf_.data(), static_cast<int>(rec->size))) {
            throw util::Corruption(fmt::format("unable to parse message at offset {} of {}", offset, slice.dat_path.string()));
          }
          msgs_[msg.sequence()] = {offset, msg.timestamp(), rec->size};
          account(msg.sequence(), rec->size, msg.timestamp());

          uint8_t buf[kMsgIndexRecSize];
          EncodeIndex(buf, {msg.sequence(), offset, msg.timestamp(), rec->size}, *crc_);
          Unwrap(out->Write(buf, kMsgIndexRecSize));

          offset += kRecordHeaderSize + rec->size;
        }
      } catch (const std::exception&) {
        // Keep the raw stream out of the wrapper's destructor.
        auto detached = out->Detach();
        if (!detached.ok()) {
          Log(*logger_, spdlog::level::warn, "failed to flush rebuilt index", {StringField("file", slice.idx_path.string()), StringField("error", detached.status().ToString())});
        }
        throw;
      }
      Unwrap(out->Detach());
      SyncFile(*idx_file_);
    } catch (const std::exception&) {
      // Remove the partial index so the next start rebuilds it from the data file.
      if (idx_file_) {
        auto status = idx_file_->Close();
        if (!status.ok()) {
          Log(*logger_, spdlog::level::warn, "failed to close index file", {StringField("file", slice.idx_path.string()), StringField("error", status.ToString())});
        }
        idx_file_.reset();
      }
      std::error_code ec;
      std::filesystem::remove(slice.idx_path, ec);
      if (ec) {
        throw util::IOError(fmt::format("error during recovery of file {}, you need to manually remove index file {} (remove failed with: {})",
                                        slice.dat_path.string(), slice.idx_path.string(), ec.message()));
      }
      throw;
    }
  }

  // Slices are recovered in any order, the caller reopens the last one.
  CloseDataAndIndexFiles();

  if (slice.msgs_count == 0) {
    return;
  }
  if (log_.first == 0 || log_.first > slice.first_seq) {
    log_.first = slice.first_seq;
  }
  if (log_.last < slice.last_seq) {
    log_.last = slice.last_seq;
  }
  log_.total_count += slice.msgs_count;
  log_.total_bytes += slice.msgs_size;

  files_[fseq] = std::move(slice);
  if (first_fslice_ == 0 || first_fslice_ > fseq) {
    first_fslice_ = fseq;
  }
  if (last_fslice_ < fseq) {
    last_fslice_ = fseq;
  }
}

void FileMsgStore::SetSliceLimits() {
  slice_count_lim_  = static_cast<uint64_t>(opts_.slice_max_msgs);
  slice_size_lim_   = static_cast<uint64_t>(opts_.slice_max_bytes);
  slice_age_lim_    = opts_.slice_max_age.count();
  slice_has_limits_ = slice_count_lim_ > 0 || slice_size_lim_ > 0 || slice_age_lim_ > 0;
  if (slice_has_limits_) {
    return;
  }

  // Nothing configured, derive from the channel limits.
  if (log_.limits.max_msgs > 0) {
    slice_count_lim_ = std::max<uint64_t>(log_.limits.max_msgs / 4, 1);
  }
  if (log_.limits.max_bytes > 0) {
    slice_size_lim_ = std::max<uint64_t>(log_.limits.max_bytes / 4, 1);
  }
  if (log_.limits.max_age.count() > 0) {
    slice_age_lim_ = std::max<int64_t>(log_.limits.max_age.count() / 4, kMinSliceAgeNanos);
  }
  slice_has_limits_ = slice_count_lim_ > 0 || slice_size_lim_ > 0 || slice_age_lim_ > 0;
}

// ------------------------------------------------------------
// Files
// ------------------------------------------------------------

void FileMsgStore::OpenDataAndIndexFiles(const FileSlice& slice) {
  auto file = OpenFile(slice.dat_path);
  auto idx  = OpenFile(slice.idx_path);

  file_     = std::move(file);
  idx_file_ = std::move(idx);
  writer_   = file_;
  if (bw_) {
    writer_ = bw_->CreateNewWriter(file_);
  }
  curr_reader_.reset();
}

void FileMsgStore::CloseDataAndIndexFiles() {
  std::exception_ptr first;
  util::CaptureFirstError(first, [&] { FlushLocked(); });
  if (bw_) {
    util::CaptureFirstError(first, [&] { bw_->Release(); });
  }
  writer_.reset();
  if (curr_reader_) {
    util::CaptureFirstError(first, [&] { Unwrap(curr_reader_->Close()); });
    curr_reader_.reset();
  }
  if (file_) {
    util::CaptureFirstError(first, [&] { Unwrap(file_->Close()); });
    file_.reset();
  }
  if (idx_file_) {
    util::CaptureFirstError(first, [&] { Unwrap(idx_file_->Close()); });
    idx_file_.reset();
  }
  if (first) {
    std::rethrow_exception(first);
  }
}

void FileMsgStore::CloseFilesQuietly() {
  std::exception_ptr first;
  for (auto& [fseq, slice] : files_) {
    if (slice.reader) {
      util::CaptureFirstError(first, [&] { Unwrap(slice.reader->Close()); });
      slice.reader.reset();
    }
  }
  if (bw_) {
    util::CaptureFirstError(first, [&] { bw_->Release(); });
  }
  writer_.reset();
  curr_reader_.reset();
  if (file_) {
    util::CaptureFirstError(first, [&] { Unwrap(file_->Close()); });
    file_.reset();
  }
  if (idx_file_) {
    util::CaptureFirstError(first, [&] { Unwrap(idx_file_->Close()); });
    idx_file_.reset();
  }
  if (first) {
    try {
      std::rethrow_exception(first);
    } catch (const std::exception& e) {
      Log(*logger_, spdlog::level::warn, "failed to close message log files", {StringField("channel", log_.subject), StringField("error", e.what())});
    }
  }
}

// Lock held on entry. `slice` is the current slice, updated to the new one.
void FileMsgStore::RollOver(FileSlice*& slice) {
  const int64_t new_fseq = last_fslice_ + 1;

  if (slice != nullptr) {
    CloseDataAndIndexFiles();
  }

  FileSlice next;
  next.dat_path = SlicePath(dir_, new_fseq, kDatSuffix);
  next.idx_path = SlicePath(dir_, new_fseq, kIdxSuffix);
  OpenDataAndIndexFiles(next);

  FileSlice* previous = slice;
  curr_slice_         = &(files_[new_fseq] = std::move(next));
  if (first_fslice_ == 0) {
    first_fslice_ = new_fseq;
  }
  last_fslice_ = new_fseq;
  w_offset_    = 4;

  // The previous slice was fully evicted but kept since it was the only one.
  if (previous != nullptr && files_.size() == 2 && previous->msgs_count == previous->rm_count) {
    RemoveFirstSlice();
  }
  slice = curr_slice_;
}

// ------------------------------------------------------------
// Store
// ------------------------------------------------------------

uint64_t FileMsgStore::Store(std::string_view data) {
  std::unique_lock lock(mutex_);
  if (log_.closed) {
    throw util::InvalidState(fmt::format("message store for [{}] is closed", log_.subject));
  }

  FileSlice* slice = curr_slice_;
  if (slice == nullptr || !file_ || slice_has_limits_) {
    if (slice == nullptr || !file_ || (slice_size_lim_ > 0 && slice->msgs_size >= slice_size_lim_) ||
        (slice_count_lim_ > 0 && slice->msgs_count >= slice_count_lim_) ||
        (slice_age_lim_ > 0 && time_tick_.load() - slice->first_write >= slice_age_lim_)) {
      RollOver(slice);
    }
  }

  const uint64_t seq = log_.last + 1;
  auto           msg = std::make_shared<v1::MsgProto>();
  msg->set_sequence(seq);
  msg->set_subject(log_.subject);
  msg->set_data(std::string(data));
  msg->set_timestamp(util::NowNanos());

  const auto msg_size   = static_cast<uint32_t>(msg->ByteSizeLong());
  const bool use_buffer = bw_ && bw_->active();
  if (use_buffer) {
    const int64_t required = msg_size + kRecordHeaderSize;
    if (required > bw_->Available()) {
      bw_->Expand(required);
      ProcessBufferedMsgs();
    }
  }
  const int64_t   rec_size = WriteRecord(*writer_, tmp_buf_, kRecNoType, *msg, *crc_);
  const MsgRecord mrec{w_offset_, msg->timestamp(), msg_size};

  bool in_buffer = false;
  if (use_buffer) {
    if (bw_->shrink_requested()) {
      bw_->CheckShrinkRequest();
    }
    // Kept aside until flushed, its index record is written then.
    if (bw_->Buffered() >= rec_size) {
      buffered_seqs_.push_back(seq);
      buffered_msgs_[seq] = {msg, mrec};
      in_buffer           = true;
    }
  }
  if (!in_buffer) {
    WriteIndex(seq, mrec);
  }

  if (log_.first == 0 || log_.first == seq) {
    // First message ever, or first after all expired.
    log_.first = seq;
    first_msg_ = msg;
    if (const int64_t max_age = log_.limits.max_age.count(); max_age > 0) {
      expiration_ = mrec.timestamp + max_age;
      WakeBackgroundTasks();
    }
  }
  log_.last = seq;
  last_msg_ = msg;
  msgs_[seq] = mrec;
  cache_.Add(seq, msg, true, mrec.timestamp);
  w_offset_ += rec_size;

  const uint64_t size = msg_size + kMsgRecordOverhead;
  log_.total_count++;
  log_.total_bytes += size;

  slice->msgs_count++;
  slice->msgs_size += size;
  if (slice->first_write == 0) {
    slice->first_write = mrec.timestamp;
  }
  if (slice->first_seq == 0) {
    slice->first_seq = seq;
  }
  slice->last_seq = seq;

  if (log_.HasCountOrBytesLimit()) {
    EnforceLimits(true);
  }
  return seq;
}

// Writes the index records of the messages that were waiting in the buffer.
void FileMsgStore::ProcessBufferedMsgs() {
  if (buffered_msgs_.empty()) {
    buffered_seqs_.clear();
    return;
  }
  const size_t needed = buffered_msgs_.size() * kMsgIndexRecSize;
  if (tmp_buf_.size() < needed) {
    tmp_buf_.resize(needed);
  }
  size_t offset = 0;
  for (uint64_t seq : buffered_seqs_) {
    auto it = buffered_msgs_.find(seq);
    if (it == buffered_msgs_.end()) {
      continue;
    }
    const MsgRecord& rec = it->second.rec;
    EncodeIndex(tmp_buf_.data() + offset, {seq, rec.offset, rec.timestamp, rec.size}, *crc_);
    offset += kMsgIndexRecSize;
    buffered_msgs_.erase(it);
  }
  if (offset > 0) {
    Unwrap(idx_file_->Write(tmp_buf_.data(), static_cast<int64_t>(offset)));
  }
  buffered_seqs_.clear();
}

void FileMsgStore::WriteIndex(uint64_t seq, const MsgRecord& rec) {
  uint8_t buf[kMsgIndexRecSize];
  EncodeIndex(buf, {seq, rec.offset, rec.timestamp, rec.size}, *crc_);
  Unwrap(idx_file_->Write(buf, kMsgIndexRecSize));
}

// ------------------------------------------------------------
// Retention
// ------------------------------------------------------------

// Lock held on entry. Returns the next expiration, 0 when the log is empty.
int64_t FileMsgStore::ExpireMsgs(int64_t now, int64_t max_age) {
  while (true) {
    auto it = msgs_.find(log_.first);
    if (it == msgs_.end()) {
      expiration_ = 0;
      break;
    }
    const int64_t elapsed = now - it->second.timestamp;
    if (elapsed >= max_age) {
      RemoveFirstMsg();
    } else {
      expiration_ = now + (max_age - elapsed);
      break;
    }
  }
  return expiration_;
}

// Lock held on entry. Always leaves the last message.
void FileMsgStore::EnforceLimits(bool report_hit_limit) {
  while (log_.OverLimits()) {
    RemoveFirstMsg();
    if (report_hit_limit) {
      log_.ReportHitLimit(*logger_);
    }
  }
}

// Lock held on entry.
void FileMsgStore::RemoveFirstMsg() {
  FileSlice& slice = files_.at(first_fslice_);

  auto           it   = msgs_.find(log_.first);
  const uint64_t size = it->second.size + kMsgRecordOverhead;
  msgs_.erase(it);

  slice.rm_count++;
  log_.total_count--;
  log_.total_bytes -= size;
  log_.first++;

  first_msg_.reset();
  if (log_.first > log_.last) {
    last_msg_.reset();
  }

  if (slice.msgs_count == slice.rm_count && files_.size() > 1) {
    RemoveFirstSlice();
  } else {
    slice.first_seq = log_.first;
  }
}

// Lock held on entry. Never called when the first slice is also the last.
void FileMsgStore::RemoveFirstSlice() {
  auto       it    = files_.find(first_fslice_);
  FileSlice& slice = it->second;

  if (slice.reader) {
    auto status = slice.reader->Close();
    if (!status.ok()) {
      Log(*logger_, spdlog::level::warn, "failed to close slice", {StringField("file", slice.dat_path.string()), StringField("error", status.ToString())});
    }
    slice.reader.reset();
  }

  bool remove = true;
  if (!opts_.slice_archive_script.empty()) {
    const std::string dat_bak = slice.dat_path.string() + kBakSuffix;
    const std::string idx_bak = slice.idx_path.string() + kBakSuffix;

    std::error_code ec;
    std::filesystem::rename(slice.dat_path, dat_bak, ec);
    if (!ec) {
      std::filesystem::rename(slice.idx_path, idx_bak, ec);
      if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(dat_bak, rm_ec);
      }
    }
    if (!ec) {
      // The script owns the files now.
      remove = false;
      StartArchiveScript(dat_bak, idx_bak);
    } else {
      Log(*logger_, spdlog::level::err, "unable to rename slice for archiving",
          {StringField("channel", log_.subject), StringField("file", slice.dat_path.string()), StringField("error", ec.message())});
    }
  }
  if (remove) {
    std::error_code ec;
    std::filesystem::remove(slice.dat_path, ec);
    std::filesystem::remove(slice.idx_path, ec);
  }

  files_.erase(it);
  // Slice numbers may have gaps if old slices were copied back in.
  while (first_fslice_ < last_fslice_) {
    ++first_fslice_;
    if (files_.count(first_fslice_) != 0) {
      break;
    }
  }
}

// Lock held on entry. Runs the archive script without blocking the store.
void FileMsgStore::StartArchiveScript(const std::string& dat, const std::string& idx) {
  // Reap the workers that are done.
  for (auto it = archivers_.begin(); it != archivers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = archivers_.erase(it);
    } else {
      ++it;
    }
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  auto run  = [logger = logger_, script = opts_.slice_archive_script, subject = log_.subject, dat, idx, done] {
    try {
      const std::string cmd = fmt::format("{} {} {} {} 2>&1", ShellQuote(script), ShellQuote(subject), ShellQuote(dat), ShellQuote(idx));
      FILE*             pipe = ::popen(cmd.c_str(), "r");
      if (pipe == nullptr) {
        Log(*logger, spdlog::level::err, "Error invoking archive script", {StringField("script", script), StringField("error", std::strerror(errno))});
      } else {
        std::string output;
        char        buf[512];
        size_t      n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
          output.append(buf, n);
        }
        const int status = ::pclose(pipe);
        if (status != 0) {
          Log(*logger, spdlog::level::err, "Error invoking archive script",
              {StringField("script", script), IntField("status", status), StringField("output", output)});
        } else {
          Log(*logger, spdlog::level::info, "Output of archive script",
              {StringField("channel", subject), StringField("dat", dat), StringField("idx", idx), StringField("output", output)});
        }
      }
    } catch (const std::exception& e) {
      Log(*logger, spdlog::level::err, "Error invoking archive script", {StringField("script", script), StringField("error", e.what())});
    }
    done->store(true);
  };
  archivers_.push_back({std::thread(std::move(run)), done});
}

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

// Lock held on entry.
std::shared_ptr<arrow::io::ReadableFile> FileMsgStore::GetFileForSeq(uint64_t seq) {
  if (files_.empty()) {
    throw util::Corruption(fmt::format("no file slice for store \"{}\", message seq: {}", log_.subject, seq));
  }
  if (curr_slice_ != nullptr && curr_slice_->first_seq <= seq && seq <= curr_slice_->last_seq) {
    if (!curr_reader_) {
      curr_reader_ = OpenRandomAccess(curr_slice_->dat_path);
    }
    return curr_reader_;
  }
  for (auto& [fseq, slice] : files_) {
    if (slice.first_seq <= seq && seq <= slice.last_seq) {
      if (!slice.reader) {
        try {
          slice.reader = OpenRandomAccess(slice.dat_path);
        } catch (const std::exception&) {
          RethrowWithContext(fmt::format("unable to open file {}: ", slice.dat_path.string()));
        }
        // Let the background task close it once unused.
        check_slices_ = true;
      }
      slice.last_used = time_tick_;
      return slice.reader;
    }
  }
  throw util::Corruption(fmt::format("could not find file slice for store \"{}\", message seq: {}", log_.subject, seq));
}

// Lock held on entry.
MsgPtr FileMsgStore::LookupLocked(uint64_t seq) {
  auto it = msgs_.find(seq);
  if (it == msgs_.end()) {
    return nullptr;
  }
  const int64_t now = util::NowNanos();
  if (auto msg = cache_.Get(seq, now)) {
    return msg;
  }
  if (auto bm = buffered_msgs_.find(seq); bm != buffered_msgs_.end()) {
    cache_.Add(seq, bm->second.msg, false, now);
    return bm->second.msg;
  }

  const MsgRecord& rec  = it->second;
  auto             file = GetFileForSeq(seq);
  auto             in   = Unwrap(arrow::io::RandomAccessFile::GetStream(file, rec.offset, kRecordHeaderSize + rec.size));
  auto             hdr  = ReadRecord(*in, tmp_buf_, false, *crc_, opts_.do_crc);
  if (!hdr) {
    throw util::Corruption(fmt::format("message {} of store \"{}\" is missing from its slice", seq, log_.subject));
  }
  auto msg = std::make_shared<v1::MsgProto>();
  if (!msg->ParseFromArray(tmp_buf_.data(), static_cast<int>(hdr->size))) {
    throw util::Corruption(fmt::format("unable to parse message {} of store \"{}\"", seq, log_.subject));
  }
  cache_.Add(seq, msg, false, now);
  return msg;
}

MsgsStats FileMsgStore::State() {
  std::shared_lock lock(mutex_);
  return log_.Stats();
}

MsgPtr FileMsgStore::Lookup(uint64_t seq) {
  std::unique_lock lock(mutex_);
  return LookupLocked(seq);
}

uint64_t FileMsgStore::FirstSequence() {
  std::shared_lock lock(mutex_);
  return log_.first;
}

uint64_t FileMsgStore::LastSequence() {
  std::shared_lock lock(mutex_);
  return log_.last;
}

std::pair<uint64_t, uint64_t> FileMsgStore::FirstAndLastSequence() {
  std::shared_lock lock(mutex_);
  return {log_.first, log_.last};
}

uint64_t FileMsgStore::GetSequenceFromTimestamp(int64_t timestamp) {
  std::shared_lock lock(mutex_);

  if (log_.total_count == 0) {
    return log_.last + 1;
  }
  uint64_t low  = log_.first;
  uint64_t high = log_.last + 1;
  while (low < high) {
    uint64_t mid = low + (high - low) / 2;
    if (msgs_.at(mid).timestamp >= timestamp) {
      high = mid;
    } else {
      low = mid + 1;
    }
  }
  return low;
}

MsgPtr FileMsgStore::FirstMsg() {
  std::unique_lock lock(mutex_);
  if (!first_msg_) {
    first_msg_ = LookupLocked(log_.first);
  }
  return first_msg_;
}

MsgPtr FileMsgStore::LastMsg() {
  std::unique_lock lock(mutex_);
  if (!last_msg_) {
    last_msg_ = LookupLocked(log_.last);
  }
  return last_msg_;
}

size_t FileMsgStore::SlicesCount() {
  std::shared_lock lock(mutex_);
  return files_.size();
}

// ------------------------------------------------------------
// Flush / Close
// ------------------------------------------------------------

// Lock held on entry.
void FileMsgStore::FlushLocked() {
  if (!file_) {
    return;
  }
  if (bw_ && bw_->active()) {
    bw_->Flush();
    ProcessBufferedMsgs();
  }
  if (opts_.do_sync) {
    SyncFile(*file_);
    SyncFile(*idx_file_);
  }
}

void FileMsgStore::Flush() {
  std::unique_lock lock(mutex_);
  if (log_.closed) {
    return;
  }
  FlushLocked();
}

void FileMsgStore::Close() {
  std::exception_ptr    first;
  std::vector<Archiver> archivers;
  {
    std::unique_lock lock(mutex_);
    if (log_.closed) {
      return;
    }
    log_.closed = true;

    for (auto& [fseq, slice] : files_) {
      if (slice.reader) {
        util::CaptureFirstError(first, [&] { Unwrap(slice.reader->Close()); });
        slice.reader.reset();
      }
    }
    if (curr_slice_ != nullptr) {
      util::CaptureFirstError(first, [&] { CloseDataAndIndexFiles(); });
    }
    archivers = std::move(archivers_);

    {
      std::lock_guard bkg_lock(bkg_mutex_);
      bkg_done_ = true;
    }
    bkg_cv_.notify_all();
  }

  if (bkg_thread_.joinable()) {
    bkg_thread_.join();
  }
  for (auto& archiver : archivers) {
    archiver.thread.join();
  }
  if (first) {
    std::rethrow_exception(first);
  }
}

// ------------------------------------------------------------
// Background tasks
// ------------------------------------------------------------

void FileMsgStore::WakeBackgroundTasks() {
  {
    std::lock_guard lock(bkg_mutex_);
    bkg_wake_ = true;
  }
  bkg_cv_.notify_one();
}

void FileMsgStore::RunBackgroundTasks() {
  bool    has_buffer      = false;
  int64_t max_age         = 0;
  int64_t next_expiration = 0;
  int64_t last_cache_check;
  int64_t last_buf_shrink;
  {
    std::shared_lock lock(mutex_);
    has_buffer       = bw_ != nullptr;
    max_age          = log_.limits.max_age.count();
    next_expiration  = expiration_;
    last_cache_check = last_buf_shrink = time_tick_;
  }

  while (true) {
    const int64_t tick = util::NowNanos();
    time_tick_         = tick;

    try {
      // Close slices opened by lookups once unused.
      if (check_slices_) {
        std::unique_lock lock(mutex_);
        if (log_.closed) {
          return;
        }
        int opened = 0;
        for (auto& [fseq, slice] : files_) {
          if (!slice.reader) {
            continue;
          }
          opened++;
          if (slice.last_used < tick && tick - slice.last_used >= kSliceIdleNanos) {
            auto reader = std::move(slice.reader);
            opened--;
            Unwrap(reader->Close());
          }
        }
        if (opened == 0) {
          check_slices_ = false;
        }
      }

      if (has_buffer && tick - last_buf_shrink >= kBufShrinkNanos) {
        last_buf_shrink = tick;
        std::unique_lock lock(mutex_);
        if (log_.closed) {
          return;
        }
        if (bw_->TryShrinkBuffer()) {
          ProcessBufferedMsgs();
        }
      }

      if (max_age > 0 && next_expiration > 0 && tick >= next_expiration) {
        std::unique_lock lock(mutex_);
        if (log_.closed) {
          return;
        }
        next_expiration = ExpireMsgs(tick, max_age);
      }

      if (tick >= last_cache_check + kCacheTTLNanos) {
        last_cache_check = tick;
        if (cache_.TryEvict()) {
          std::unique_lock lock(mutex_);
          if (log_.closed) {
            return;
          }
          cache_.Evict(tick);
        }
      }
    } catch (const std::exception& e) {
      Log(*logger_, spdlog::level::err, "message store background task failed", {StringField("channel", log_.subject), StringField("error", e.what())});
    }

    std::unique_lock lock(bkg_mutex_);
    bkg_cv_.wait_for(lock, kBkgTasksSleep, [this] { return bkg_done_ || bkg_wake_; });
    if (bkg_done_) {
      return;
    }
    if (bkg_wake_) {
      bkg_wake_ = false;
      lock.unlock();
      std::shared_lock store_lock(mutex_);
      next_expiration = expiration_;
    }
  }
}

} // namespace msgstore::stores::file
