#pragma once

#include <arrow/io/file.h>

#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include <google/protobuf/message_lite.h>
#include <spdlog/logger.h>

#include "internal/stores/common/log_state.hpp"
#include "internal/stores/file/buffered_writer.hpp"
#include "internal/stores/file/crc32.hpp"
#include "internal/stores/file/file_store_options.hpp"
#include "internal/stores/file/record_codec.hpp"
#include "internal/util/time.hpp"

namespace msgstore::stores::file {

/*
  File backed subscriptions log of one channel (subs.dat).

  Every change is appended as a typed record. Records made obsolete by
  later ones (updates, deletes, acks) are counted so that the file can
  be compacted, i.e. rewritten with only the live state, once the
  fragmentation goes over the configured threshold.
*/
class FileSubStore final : public SubStore {
 public:
  FileSubStore(std::filesystem::path dir, std::string subject, const SubStoreLimits& limits, const FileStoreOptions& opts,
               std::shared_ptr<const Crc32Table> crc_table, bool recover, std::shared_ptr<spdlog::logger> logger);
  ~FileSubStore() override;

  void CreateSub(v1::SubState& sub) override;
  void UpdateSub(const v1::SubState& sub) override;
  void DeleteSub(uint64_t sub_id) override;

  void AddSeqPending(uint64_t sub_id, uint64_t seqno) override;
  void AckSeqPending(uint64_t sub_id, uint64_t seqno) override;

  void Flush() override;
  void Close() override;

  // Snapshot of the live subscriptions and their pending sequences.
  std::vector<RecoveredSubState> Subscriptions() const;

 private:
  struct Subscription {
    v1::SubState       sub;
    std::set<uint64_t> seqnos;
  };

  void    Recover();
  void    SetWriter();
  void    WriteSubRecord(RecordType type, const google::protobuf::MessageLite& rec);
  int64_t Append(arrow::io::OutputStream& out, RecordType type, const google::protobuf::MessageLite& rec);
  bool    ShouldCompact() const;
  void    TryCompact();
  void    Compact();
  void    FlushLocked();
  void    RunShrinkTimer();

  const std::filesystem::path             dir_;
  const std::filesystem::path             file_path_;
  const FileStoreOptions                  opts_;
  const std::shared_ptr<const Crc32Table> crc_;
  std::shared_ptr<spdlog::logger>         logger_;

  mutable std::shared_mutex          mutex_;
  SubLogState                        log_;
  std::map<uint64_t, Subscription> subs_;

  std::shared_ptr<arrow::io::FileOutputStream> file_;
  std::shared_ptr<arrow::io::OutputStream>     writer_;
  std::unique_ptr<BufferedWriter>              bw_;
  std::vector<uint8_t>                         tmp_buf_;

  // Compaction accounting.
  int64_t         num_recs_  = 0;
  int64_t         del_recs_  = 0;
  int64_t         file_size_ = 0;
  util::TimePoint compact_ts_{};
  // Something was written since the last flush.
  bool activity_ = false;

  std::condition_variable_any shrink_cv_;
  std::thread                 shrink_timer_;
};

} // namespace msgstore::stores::file
