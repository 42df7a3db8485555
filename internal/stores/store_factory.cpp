#include "store_factory.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/observability/logging.hpp"
#include "internal/stores/file/file_store.hpp"
#include "internal/stores/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace msgstore::stores {

using namespace msgstore::observability;
namespace cfg = msgstore::runtime::config;

namespace {

std::chrono::nanoseconds ToNanos(const google::protobuf::Duration& d) {
  return std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos());
}

ChannelLimits ChannelLimitsFromConfig(const cfg::ChannelLimitsConfig& config) {
  ChannelLimits limits;
  limits.msgs.max_msgs          = config.max_msgs();
  limits.msgs.max_bytes         = config.max_bytes();
  limits.msgs.max_age           = ToNanos(config.max_age());
  limits.subs.max_subscriptions = config.max_subscriptions();
  return limits;
}

} // namespace

StoreLimits StoreFactory::LimitsFromConfig(const cfg::LimitsConfig& config) {
  if (!config.enabled()) {
    return DefaultStoreLimits();
  }
  StoreLimits limits;
  limits.max_channels = config.max_channels();
  limits.channel      = ChannelLimitsFromConfig(config.channel());
  for (const auto& [name, channel] : config.per_channel()) {
    limits.per_channel[name] = ChannelLimitsFromConfig(channel);
  }
  limits.Build();
  return limits;
}

std::vector<file::FileStoreOption> StoreFactory::FileOptionsFromConfig(const cfg::FileStoreConfig& config) {
  std::vector<file::FileStoreOption> options;
  if (config.has_buffer_size()) options.push_back(file::BufferSize(config.buffer_size()));
  if (config.has_compact_enabled()) options.push_back(file::CompactEnabled(config.compact_enabled()));
  if (config.has_compact_interval()) options.push_back(file::CompactInterval(config.compact_interval().seconds()));
  if (config.has_compact_fragmentation()) options.push_back(file::CompactFragmentation(config.compact_fragmentation()));
  if (config.has_compact_min_file_size()) options.push_back(file::CompactMinFileSize(config.compact_min_file_size()));
  if (config.has_do_crc()) options.push_back(file::DoCRC(config.do_crc()));
  if (config.has_crc_polynomial()) options.push_back(file::CRCPolynomial(config.crc_polynomial()));
  if (config.has_do_sync()) options.push_back(file::DoSync(config.do_sync()));
  if (config.has_slice()) {
    const auto& slice = config.slice();
    options.push_back(file::SliceConfig(slice.max_msgs(), slice.max_bytes(), ToNanos(slice.max_age()), slice.archive_script()));
  }
  return options;
}

OpenedStore StoreFactory::Build(const cfg::StoreConfig& config, std::shared_ptr<spdlog::logger> logger) {
  logger            = ResolveLogger(std::move(logger));
  const auto limits = LimitsFromConfig(config.limits());

  OpenedStore opened;
  switch (config.type()) {
    case cfg::STORE_TYPE_UNSPECIFIED:
    case cfg::STORE_TYPE_MEMORY:
      opened.store = std::make_unique<memory::MemoryStore>(limits, logger);
      break;

    case cfg::STORE_TYPE_FILE: {
      if (config.root_dir().empty()) {
        throw util::InvalidConfig("file store requires root_dir");
      }
      auto [store, recovered] = file::FileStore::Open(config.root_dir(), limits, FileOptionsFromConfig(config.file()), logger);
      opened.store     = std::move(store);
      opened.recovered = std::move(recovered);
      break;
    }

    default:
      throw util::InvalidConfig(fmt::format("unsupported store type: {}", static_cast<int>(config.type())));
  }

  Log(*logger, spdlog::level::info, "store opened",
      {StringField("type", opened.store->Name()), BoolField("recovered", opened.recovered.has_value())});
  return opened;
}

} // namespace msgstore::stores
