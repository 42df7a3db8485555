#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <spdlog/logger.h>

#include "config/config.pb.h"
#include "internal/stores/api/store.hpp"
#include "internal/stores/file/file_store_options.hpp"

namespace msgstore::stores {

struct OpenedStore {
  std::unique_ptr<Store>        store;
  // Empty for the memory store and for a file store never initialized.
  std::optional<RecoveredState> recovered;
};

/*
  Builds a store from configuration.

      auto opened = StoreFactory::Build(config, logger);
      opened.store->CreateChannel("orders", {});

  This is the only place that knows the concrete store types.
*/
class StoreFactory {
 public:
  static OpenedStore Build(const msgstore::runtime::config::StoreConfig& config, std::shared_ptr<spdlog::logger> logger = nullptr);

  static StoreLimits                        LimitsFromConfig(const msgstore::runtime::config::LimitsConfig& config);
  static std::vector<file::FileStoreOption> FileOptionsFromConfig(const msgstore::runtime::config::FileStoreConfig& config);
};

} // namespace msgstore::stores
