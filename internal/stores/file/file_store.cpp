#include "file_store.hpp"

#include <arrow/io/buffered.h>
#include <arrow/memory_pool.h>
#include <spdlog/fmt/fmt.h>

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/stores/file/file_io.hpp"
#include "internal/stores/file/file_msg_store.hpp"
#include "internal/stores/file/file_sub_store.hpp"
#include "internal/util/errors.hpp"

namespace msgstore::stores::file {

using namespace msgstore::observability;

namespace {

constexpr const char* kServerFileName  = "server.dat";
constexpr const char* kClientsFileName = "clients.dat";

template <typename T>
T ParseRecord(const std::vector<uint8_t>& buf, uint32_t size) {
  T rec;
  if (!rec.ParseFromArray(buf.data(), static_cast<int>(size))) {
    throw util::Corruption(fmt::format("unable to parse {} record", rec.GetTypeName()));
  }
  return rec;
}

} // namespace

std::pair<std::unique_ptr<FileStore>, std::optional<RecoveredState>> FileStore::Open(const std::filesystem::path& root_dir,
                                                                                      const StoreLimits& limits,
                                                                                      const std::vector<FileStoreOption>& options,
                                                                                      std::shared_ptr<spdlog::logger> logger) {
  FileStoreOptions opts;
  for (const auto& opt : options) {
    opt(opts);
  }
  Validate(opts);

  std::unique_ptr<FileStore> store(new FileStore(root_dir, limits, std::move(opts), std::move(logger)));
  std::optional<RecoveredState> state;
  try {
    state = store->Recover();
  } catch (const std::exception&) {
    try {
      store->Close();
    } catch (const std::exception& e) {
      Log(*store->logger_, spdlog::level::warn, "failed to close file store after recovery error", {StringField("error", e.what())});
    }
    throw;
  }
  return {std::move(store), std::move(state)};
}

FileStore::FileStore(std::filesystem::path root_dir, const StoreLimits& limits, FileStoreOptions opts,
                     std::shared_ptr<spdlog::logger> logger)
    : root_(std::move(root_dir)),
      server_path_(root_ / kServerFileName),
      clients_path_(root_ / kClientsFileName),
      opts_(std::move(opts)),
      crc_(std::make_shared<const Crc32Table>(opts_.crc_polynomial)),
      logger_(ResolveLogger(std::move(logger))),
      generic_(kTypeFile, limits) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw util::IOError(fmt::format("unable to create the root directory [{}]: {}", root_.string(), ec.message()));
  }
  server_file_  = OpenFile(server_path_);
  clients_file_ = OpenFile(clients_path_);
}

FileStore::~FileStore() {
  try {
    Close();
  } catch (const std::exception& e) {
    Log(*logger_, spdlog::level::err, "failed to close file store", {StringField("root", root_.string()), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Recovery
// ------------------------------------------------------------

std::optional<RecoveredState> FileStore::Recover() {
  auto info = RecoverServerInfo();
  if (!info) {
    // Never initialized.
    return std::nullopt;
  }

  RecoveredState state;
  state.info    = std::move(*info);
  state.clients = RecoverClients();

  const StoreLimits limits = generic_.Limits();
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (!entry.is_directory()) {
      continue;
    }
    const std::string channel = entry.path().filename().string();
    auto cs = NewChannelStore(channel, limits.ForChannel(channel), true);

    auto* subs = static_cast<FileSubStore*>(cs->subs.get());
    state.subs[channel] = subs->Subscriptions();
    generic_.AddRecoveredChannel(channel, std::move(cs));
  }

  Log(*logger_, spdlog::level::info, "recovered file store",
      {StringField("root", root_.string()), IntField("clients", static_cast<int64_t>(state.clients.size())),
       IntField("channels", static_cast<int64_t>(state.subs.size()))});
  return state;
}

std::optional<v1::ServerInfo> FileStore::RecoverServerInfo() {
  auto in  = OpenReader(server_path_, kDefaultBufSize);
  auto rec = ReadRecord(*in, tmp_buf_, false, *crc_, opts_.do_crc);
  if (!rec) {
    return std::nullopt;
  }
  // Version and record header come on top of the record.
  const int64_t expected = static_cast<int64_t>(rec->size) + kCrcSize + kRecordHeaderSize;
  const int64_t actual   = FileSize(server_path_);
  if (actual != expected) {
    throw util::Corruption(fmt::format("incorrect file size, expected {} bytes, got {} bytes", expected, actual));
  }
  return ParseRecord<v1::ServerInfo>(tmp_buf_, rec->size);
}

std::vector<Client> FileStore::RecoverClients() {
  std::unordered_map<std::string, v1::ClientInfo> clients;

  auto in = OpenReader(clients_path_, kDefaultBufSize);
  while (auto rec = ReadRecord(*in, tmp_buf_, true, *crc_, opts_.do_crc)) {
    cli_file_size_ += rec->size + kRecordHeaderSize;
    switch (rec->type) {
      case kClientRecAdd: {
        auto info = ParseRecord<v1::ClientInfo>(tmp_buf_, rec->size);
        // A duplicate should not happen, the latest one wins.
        std::string id = info.id();
        clients[id]    = std::move(info);
        break;
      }
      case kClientRecDel: {
        auto del = ParseRecord<v1::ClientDelete>(tmp_buf_, rec->size);
        clients.erase(del.id());
        cli_delete_recs_++;
        break;
      }
      default:
        throw util::Corruption(fmt::format("invalid client record type: {}", rec->type));
    }
  }

  std::vector<Client> result;
  result.reserve(clients.size());
  for (auto& [id, info] : clients) {
    Client c;
    c.info = std::move(info);
    generic_.AddRecoveredClient(c);
    result.push_back(std::move(c));
  }
  return result;
}

std::unique_ptr<ChannelStore> FileStore::NewChannelStore(const std::string& channel, const ChannelLimits& limits, bool recover) {
  const auto dir = root_ / channel;

  auto cs  = std::make_unique<ChannelStore>();
  cs->msgs = std::make_unique<FileMsgStore>(dir, channel, limits.msgs, opts_, crc_, recover, logger_);
  try {
    cs->subs = std::make_unique<FileSubStore>(dir, channel, limits.subs, opts_, crc_, recover, logger_);
  } catch (const std::exception&) {
    try {
      cs->msgs->Close();
    } catch (const std::exception& e) {
      Log(*logger_, spdlog::level::warn, "failed to close message store", {StringField("channel", channel), StringField("error", e.what())});
    }
    throw;
  }
  return cs;
}

// ------------------------------------------------------------
// Store interface
// ------------------------------------------------------------

void FileStore::Init(const v1::ServerInfo& info) {
  std::lock_guard lock(file_mutex_);
  if (closed_) {
    throw util::InvalidState("file store is closed");
  }
  Unwrap(server_file_->Close());
  server_file_ = CreateFile(server_path_);
  WriteRecord(*server_file_, tmp_buf_, kRecNoType, info, *crc_);
  if (opts_.do_sync) {
    SyncFile(*server_file_);
  }
}

std::string FileStore::Name() const {
  return generic_.Name();
}

void FileStore::SetLimits(const StoreLimits& limits) {
  generic_.SetLimits(limits);
}

std::pair<ChannelStore*, bool> FileStore::CreateChannel(const std::string& channel, std::any user_data) {
  return generic_.CreateChannel(channel, std::move(user_data), [this](const std::string& name, const ChannelLimits& limits) {
    std::error_code ec;
    std::filesystem::create_directories(root_ / name, ec);
    if (ec) {
      throw util::IOError(fmt::format("unable to create directory for channel [{}]: {}", name, ec.message()));
    }
    return NewChannelStore(name, limits, false);
  });
}

ChannelStore* FileStore::LookupChannel(const std::string& channel) {
  return generic_.LookupChannel(channel);
}

bool FileStore::HasChannel() {
  return generic_.HasChannel();
}

MsgsStats FileStore::MsgsState(const std::string& channel) {
  return generic_.MsgsState(channel);
}

std::pair<Client, bool> FileStore::AddClient(const std::string& client_id, const std::string& hb_inbox, std::any user_data) {
  return generic_.AddClient(client_id, hb_inbox, std::move(user_data), [this](const Client& client) {
    std::lock_guard lock(file_mutex_);
    WriteClientRecord(kClientRecAdd, client.info);
  });
}

std::optional<Client> FileStore::GetClient(const std::string& client_id) {
  return generic_.GetClient(client_id);
}

std::unordered_map<std::string, Client> FileStore::GetClients() {
  return generic_.GetClients();
}

size_t FileStore::GetClientsCount() {
  return generic_.GetClientsCount();
}

std::optional<Client> FileStore::DeleteClient(const std::string& client_id) {
  return generic_.DeleteClient(client_id, [this](const Client& deleted, const std::unordered_map<std::string, Client>& remaining) {
    std::lock_guard lock(file_mutex_);
    v1::ClientDelete del;
    del.set_id(deleted.info.id());
    WriteClientRecord(kClientRecDel, del);
    cli_delete_recs_++;

    if (!ShouldCompactClientFile(remaining.size())) {
      return;
    }
    try {
      CompactClientFile(remaining);
    } catch (const std::exception& e) {
      Log(*logger_, spdlog::level::err, "clients file compaction failed", {StringField("error", e.what())});
    }
  });
}

// ------------------------------------------------------------
// Clients file
// ------------------------------------------------------------

// file_mutex_ held on entry.
int64_t FileStore::WriteClientRecord(RecordType type, const google::protobuf::MessageLite& rec) {
  if (closed_) {
    throw util::InvalidState("file store is closed");
  }
  const int64_t size = WriteRecord(*clients_file_, tmp_buf_, type, rec, *crc_);
  cli_file_size_ += size;
  return size;
}

// file_mutex_ held on entry.
bool FileStore::ShouldCompactClientFile(size_t clients_count) const {
  if (!opts_.compact_enabled) {
    return false;
  }
  if (opts_.compact_min_file_size > 0 && cli_file_size_ < opts_.compact_min_file_size) {
    return false;
  }
  const int64_t total = cli_delete_recs_ + static_cast<int64_t>(clients_count);
  if (total == 0 || cli_delete_recs_ * 100 / total < opts_.compact_fragmentation) {
    return false;
  }
  return util::Now() - cli_compact_ts_ >= opts_.compact_interval;
}

// file_mutex_ held on entry.
void FileStore::CompactClientFile(const std::unordered_map<std::string, Client>& clients) {
  TempFile tmp       = CreateTempFile(root_, kClientsFileName);
  int64_t  file_size = 0;

  try {
    auto out = Unwrap(arrow::io::BufferedOutputStream::Create(kDefaultBufSize, arrow::default_memory_pool(), tmp.stream));
    for (const auto& [id, c] : clients) {
      file_size += WriteRecord(*out, tmp_buf_, kClientRecAdd, c.info, *crc_);
    }
    Unwrap(out->Detach());
    if (opts_.do_sync) {
      SyncFile(*tmp.stream);
    }
  } catch (const std::exception&) {
    auto status = tmp.stream->Close();
    if (!status.ok()) {
      Log(*logger_, spdlog::level::warn, "failed to close temporary file", {StringField("file", tmp.path.string()), StringField("error", status.ToString())});
    }
    std::error_code ec;
    std::filesystem::remove(tmp.path, ec);
    throw;
  }
  SwapFiles(tmp, clients_path_, clients_file_);

  cli_delete_recs_ = 0;
  cli_file_size_   = file_size;
  cli_compact_ts_  = util::Now();
}

// ------------------------------------------------------------
// Close
// ------------------------------------------------------------

void FileStore::Close() {
  {
    std::lock_guard lock(file_mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }

  std::exception_ptr first;
  util::CaptureFirstError(first, [&] { generic_.Close(); });

  std::lock_guard lock(file_mutex_);
  if (server_file_) {
    util::CaptureFirstError(first, [&] { Unwrap(server_file_->Close()); });
  }
  if (clients_file_) {
    util::CaptureFirstError(first, [&] { Unwrap(clients_file_->Close()); });
  }
  if (first) {
    std::rethrow_exception(first);
  }
}

} // namespace msgstore::stores::file
