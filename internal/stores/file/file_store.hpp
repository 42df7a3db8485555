#pragma once

#include <arrow/io/file.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <google/protobuf/message_lite.h>
#include <spdlog/logger.h>

#include "internal/stores/common/generic_store.hpp"
#include "internal/stores/file/crc32.hpp"
#include "internal/stores/file/file_store_options.hpp"
#include "internal/stores/file/record_codec.hpp"
#include "internal/util/time.hpp"

namespace msgstore::stores::file {

/*
  Store persisted under a root directory:

    server.dat    server identity, rewritten by Init()
    clients.dat   client registry, append only, compacted on deletes
    <channel>/    one directory per channel, see FileMsgStore and FileSubStore

  Lock order: the registry lock (GenericStore) before file_mutex_.
*/
class FileStore final : public Store {
 public:
  // Opens or creates the store. The second element is the state found on
  // disk, empty for a store never initialized.
  static std::pair<std::unique_ptr<FileStore>, std::optional<RecoveredState>> Open(
      const std::filesystem::path& root_dir, const StoreLimits& limits = DefaultStoreLimits(),
      const std::vector<FileStoreOption>& options = {}, std::shared_ptr<spdlog::logger> logger = nullptr);

  ~FileStore() override;

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

  const FileStoreOptions& options() const {
    return opts_;
  }

 private:
  FileStore(std::filesystem::path root_dir, const StoreLimits& limits, FileStoreOptions opts, std::shared_ptr<spdlog::logger> logger);

  std::optional<RecoveredState> Recover();
  std::optional<v1::ServerInfo> RecoverServerInfo();
  std::vector<Client>           RecoverClients();

  std::unique_ptr<ChannelStore> NewChannelStore(const std::string& channel, const ChannelLimits& limits, bool recover);

  int64_t WriteClientRecord(RecordType type, const google::protobuf::MessageLite& rec);
  bool    ShouldCompactClientFile(size_t clients_count) const;
  void    CompactClientFile(const std::unordered_map<std::string, Client>& clients);

  const std::filesystem::path             root_;
  const std::filesystem::path             server_path_;
  const std::filesystem::path             clients_path_;
  const FileStoreOptions                  opts_;
  const std::shared_ptr<const Crc32Table> crc_;
  std::shared_ptr<spdlog::logger>         logger_;

  GenericStore generic_;

  std::mutex                                   file_mutex_;
  std::shared_ptr<arrow::io::FileOutputStream> server_file_;
  std::shared_ptr<arrow::io::FileOutputStream> clients_file_;
  int64_t                                      cli_file_size_   = 0;
  int64_t                                      cli_delete_recs_ = 0;
  util::TimePoint                              cli_compact_ts_{};
  std::vector<uint8_t>                         tmp_buf_;
  bool                                         closed_ = false;
};

} // namespace msgstore::stores::file
