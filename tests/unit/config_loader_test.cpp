#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/stores/store_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using msgstore::config::ConfigLoader;
using msgstore::stores::StoreFactory;
namespace cfg = msgstore::runtime::config;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "msgstore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullFileStoreConfig() {
  const auto yaml_path = WriteYaml("full", R"(type: file
root_dir: "/tmp/msgstore data"
logging:
  level: debug
limits:
  enabled: true
  max_channels: 10
  channel:
    max_msgs: 1000
    max_bytes: 1048576
    max_age: "30s"
    max_subscriptions: 20
  per_channel:
    orders:
      max_msgs: 100
file:
  buffer_size: 4096
  compact_enabled: false
  compact_interval: "60s"
  do_sync: false
  crc_polynomial: 2197175160
  slice:
    max_msgs: 500
    max_age: "1.5s"
    archive_script: "/usr/local/bin/archive.sh"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.type() == cfg::STORE_TYPE_FILE);
  assert(config.root_dir() == "/tmp/msgstore data");
  assert(config.logging().level() == "debug");
  assert(config.limits().channel().max_age().seconds() == 30);
  assert(config.limits().per_channel().at("orders").max_msgs() == 100);
  assert(config.file().has_buffer_size() && config.file().buffer_size() == 4096);
  assert(!config.file().has_do_crc());
  assert(config.file().slice().max_age().nanos() == 500000000);

  auto limits = StoreFactory::LimitsFromConfig(config.limits());
  assert(limits.max_channels == 10);
  // Inherited from the global limits.
  assert(limits.ForChannel("orders").msgs.max_bytes == 1048576);
  assert(limits.ForChannel("orders").msgs.max_msgs == 100);
  assert(limits.ForChannel("other").msgs.max_age == std::chrono::seconds(30));

  msgstore::stores::file::FileStoreOptions opts;
  for (const auto& opt : StoreFactory::FileOptionsFromConfig(config.file())) {
    opt(opts);
  }
  assert(opts.buffer_size == 4096);
  assert(!opts.compact_enabled);
  assert(opts.compact_interval == std::chrono::seconds(60));
  assert(opts.do_crc);
  assert(!opts.do_sync);
  assert(opts.crc_polynomial == msgstore::stores::file::Crc32Table::kCastagnoli);
  assert(opts.slice_max_msgs == 500);
  assert(opts.slice_max_age == std::chrono::milliseconds(1500));
  assert(opts.slice_archive_script == "/usr/local/bin/archive.sh");
}

void TestDisabledLimitsUseDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("type: memory\n");
  assert(config.type() == cfg::STORE_TYPE_MEMORY);
  auto limits = StoreFactory::LimitsFromConfig(config.limits());
  assert(limits.max_channels == msgstore::stores::DefaultStoreLimits().max_channels);

  auto opened = StoreFactory::Build(config);
  assert(opened.store->Name() == "MEMORY");
  assert(!opened.recovered.has_value());
  opened.store->Close();
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(type: memory
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const msgstore::util::InvalidConfig&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidLimitsAreRejected() {
  auto config = ConfigLoader::LoadFromYamlString(R"(limits:
  enabled: true
  channel:
    max_msgs: 10
  per_channel:
    foo:
      max_msgs: 20
)");
  bool threw = false;
  try {
    (void)StoreFactory::LimitsFromConfig(config.limits());
  } catch (const msgstore::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestFileStoreRequiresRootDir() {
  auto config = ConfigLoader::LoadFromYamlString("type: file\n");
  bool threw  = false;
  try {
    (void)StoreFactory::Build(config);
  } catch (const msgstore::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFile() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/msgstore.yaml");
  } catch (const msgstore::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullFileStoreConfig();
  TestDisabledLimitsUseDefaults();
  TestUnknownFieldsAreRejected();
  TestInvalidLimitsAreRejected();
  TestFileStoreRequiresRootDir();
  TestMissingFile();

  std::cout << "msgstore_unit_config_loader: pass\n";
  return 0;
}
