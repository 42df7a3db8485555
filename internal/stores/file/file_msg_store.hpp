#pragma once

#include <arrow/io/file.h>

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "internal/stores/common/log_state.hpp"
#include "internal/stores/file/buffered_writer.hpp"
#include "internal/stores/file/crc32.hpp"
#include "internal/stores/file/file_store_options.hpp"
#include "internal/stores/file/msgs_cache.hpp"

namespace msgstore::stores::file {

/*
  File backed message log of one channel.

  Messages are appended to numbered slices (msgs.<n>.dat), each with an
  index file (msgs.<n>.idx) of fixed size records. A new slice is started
  when the current one reaches the slice limits, and the oldest slice is
  removed (or handed to the archive script) once all its messages have
  been dropped by the channel limits.

  Offsets and timestamps of every stored message are kept in memory, the
  index file is only read on recovery. A background thread closes slices
  opened for lookups, shrinks the write buffer, expires messages by age
  and evicts the message cache.
*/
class FileMsgStore final : public MsgStore {
 public:
  // When `recover` is set, reloads the slices found in `dir`.
  // Throws with "unable to recover|create message store for [<channel>]: " prepended.
  FileMsgStore(std::filesystem::path dir, std::string subject, const MsgStoreLimits& limits, const FileStoreOptions& opts,
               std::shared_ptr<const Crc32Table> crc_table, bool recover, std::shared_ptr<spdlog::logger> logger);
  ~FileMsgStore() override;

  MsgsStats State() override;
  uint64_t  Store(std::string_view data) override;
  MsgPtr    Lookup(uint64_t seq) override;

  uint64_t                      FirstSequence() override;
  uint64_t                      LastSequence() override;
  std::pair<uint64_t, uint64_t> FirstAndLastSequence() override;
  uint64_t                      GetSequenceFromTimestamp(int64_t timestamp) override;

  MsgPtr FirstMsg() override;
  MsgPtr LastMsg() override;

  void Flush() override;
  void Close() override;

  // Number of slices currently tracked.
  size_t SlicesCount();

 private:
  struct MsgRecord {
    int64_t  offset    = 0;
    int64_t  timestamp = 0;
    uint32_t size      = 0;
  };

  struct BufferedMsg {
    MsgPtr    msg;
    MsgRecord rec;
  };

  struct Archiver {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  struct FileSlice {
    std::filesystem::path dat_path;
    std::filesystem::path idx_path;
    uint64_t              first_seq   = 0;
    uint64_t              last_seq    = 0;
    uint64_t              msgs_count  = 0;
    uint64_t              msgs_size   = 0;
    uint64_t              rm_count    = 0;
    int64_t               first_write = 0;
    // Opened on demand for lookups of non current slices.
    std::shared_ptr<arrow::io::ReadableFile> reader;
    int64_t                                  last_used = 0;
  };

  void Recover();
  void RecoverOneSlice(FileSlice& slice, int64_t fseq);
  void SetSliceLimits();

  void OpenDataAndIndexFiles(const FileSlice& slice);
  void CloseDataAndIndexFiles();

  void RollOver(FileSlice*& slice);
  void ProcessBufferedMsgs();
  void WriteIndex(uint64_t seq, const MsgRecord& rec);

  int64_t ExpireMsgs(int64_t now, int64_t max_age);
  void    EnforceLimits(bool report_hit_limit);
  void    RemoveFirstMsg();
  void    RemoveFirstSlice();
  void    StartArchiveScript(const std::string& dat, const std::string& idx);

  std::shared_ptr<arrow::io::ReadableFile> GetFileForSeq(uint64_t seq);
  MsgPtr                                   LookupLocked(uint64_t seq);

  void FlushLocked();
  void CloseFilesQuietly();
  void RunBackgroundTasks();
  void WakeBackgroundTasks();

  const std::filesystem::path             dir_;
  const FileStoreOptions                  opts_;
  const std::shared_ptr<const Crc32Table> crc_;
  std::shared_ptr<spdlog::logger>         logger_;

  mutable std::shared_mutex mutex_;
  MsgLogState               log_;

  std::unordered_map<uint64_t, MsgRecord> msgs_;
  std::map<int64_t, FileSlice>            files_;
  int64_t                                 first_fslice_ = 0;
  int64_t                                 last_fslice_  = 0;
  FileSlice*                              curr_slice_   = nullptr;

  std::shared_ptr<arrow::io::FileOutputStream> file_;
  std::shared_ptr<arrow::io::FileOutputStream> idx_file_;
  std::shared_ptr<arrow::io::OutputStream>     writer_;
  // Read side of the current slice, opened on first lookup.
  std::shared_ptr<arrow::io::ReadableFile> curr_reader_;
  int64_t                                  w_offset_ = 4;

  std::unique_ptr<BufferedWriter>              bw_;
  std::vector<uint64_t>                        buffered_seqs_;
  std::unordered_map<uint64_t, BufferedMsg>    buffered_msgs_;

  uint64_t slice_count_lim_  = 0;
  uint64_t slice_size_lim_   = 0;
  int64_t  slice_age_lim_    = 0;
  bool     slice_has_limits_ = false;

  MsgsCache cache_;
  MsgPtr    first_msg_;
  MsgPtr    last_msg_;

  std::vector<uint8_t> tmp_buf_;

  // Background tasks.
  int64_t                  expiration_ = 0;
  std::atomic<int64_t>     time_tick_{0};
  std::atomic<bool>        check_slices_{false};
  std::mutex               bkg_mutex_;
  std::condition_variable  bkg_cv_;
  bool                     bkg_done_ = false;
  bool                     bkg_wake_ = false;
  std::thread              bkg_thread_;
  std::vector<Archiver>     archivers_;
};

} // namespace msgstore::stores::file
