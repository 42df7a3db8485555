#include <iostream>
#include <map>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stores/store_factory.hpp"

using msgstore::stores::StoreFactory;

/*
  Opens the store described by the config (recovering it when file based),
  prints what it holds and closes it again.
*/
int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: msgstore-inspect <config.yaml> OR msgstore-inspect --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = msgstore::config::ConfigLoader::LoadFromYaml(config_path);
    msgstore::observability::InitializeLogging(config.logging());

    auto opened = StoreFactory::Build(config);
    auto& store = *opened.store;

    std::cout << "type: " << store.Name() << "\n";
    std::cout << "recovered: " << (opened.recovered ? "true" : "false") << "\n";
    std::cout << "clients: " << store.GetClientsCount() << "\n";

    if (opened.recovered) {
      // Sorted for a stable output.
      std::map<std::string, size_t> channels;
      for (const auto& [name, subs] : opened.recovered->subs) {
        channels[name] = subs.size();
      }
      for (const auto& [name, subs_count] : channels) {
        auto* cs = store.LookupChannel(name);
        if (cs == nullptr) {
          continue;
        }
        const auto stats         = cs->msgs->State();
        const auto [first, last] = cs->msgs->FirstAndLastSequence();
        std::cout << "channel " << name << ": msgs=" << stats.count << " bytes=" << stats.bytes << " first=" << first
                  << " last=" << last << " subs=" << subs_count << "\n";
      }
    }

    store.Close();
    msgstore::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    MSGSTORE_LOG_ERROR("Fatal error", {msgstore::observability::StringField("error", e.what())});
    msgstore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
