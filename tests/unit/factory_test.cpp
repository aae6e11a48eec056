#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/relay/memory_relay.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using recsync::config::ConfigLoader;

std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "recsync_factory_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestHostIdIsGeneratedOnce() {
  const auto dir    = TempDir("host_id");
  const auto config = ConfigLoader::LoadFromYamlString("host:\n  id_path: " + (dir / "host_id").string() + "\n");

  const auto first = recsync::factory::LoadOrCreateHostId(config);
  assert(recsync::util::IsUUID(first));
  assert(recsync::factory::LoadOrCreateHostId(config) == first);

  const auto fixed = ConfigLoader::LoadFromYamlString("host:\n  id: laptop\n");
  assert(recsync::factory::LoadOrCreateHostId(fixed) == "laptop");

  bool threw = false;
  try {
    (void)recsync::factory::LoadOrCreateHostId(ConfigLoader::LoadFromYamlString("relay:\n  address: memory\n"));
  } catch (const recsync::util::SerializationFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestMasterKeyNeedsPath() {
  bool threw = false;
  try {
    (void)recsync::factory::LoadOrCreateMasterKey(ConfigLoader::LoadFromYamlString("host:\n  id: h\n"));
  } catch (const recsync::util::SerializationFailure&) {
    threw = true;
  }
  assert(threw);

  const auto dir    = TempDir("key");
  const auto config = ConfigLoader::LoadFromYamlString("key:\n  path: " + (dir / "key").string() + "\n");
  assert(recsync::factory::LoadOrCreateMasterKey(config) == recsync::factory::LoadOrCreateMasterKey(config));
}

void TestEncryptorAndRelayFromConfig() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(encryption:
  scheme: chacha20-poly1305
relay:
  address: memory
  page_size: 7
  verify_downloads: true
  scope: kv
)");

  assert(recsync::factory::BuildEncryptor(config)->SchemeName() == "chacha20-poly1305");

  auto relay = recsync::factory::BuildRelayClient(config);
  assert(std::dynamic_pointer_cast<recsync::relay::MemoryRelay>(relay) != nullptr);

  const auto options = recsync::factory::BuildSyncOptions(config);
  assert(options.page_size == 7);
  assert(options.verify_downloads);
  assert(options.scope == "kv");

  bool threw = false;
  try {
    (void)recsync::factory::BuildEncryptor(ConfigLoader::LoadFromYamlString("encryption:\n  scheme: des\n"));
  } catch (const recsync::util::SerializationFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestRuntimeRoundTrip(const std::string& database_yaml) {
  const auto dir  = TempDir("runtime");
  const auto yaml = "host:\n  id_path: " + (dir / "host_id").string() + "\nkey:\n  path: " + (dir / "key").string() + "\n" + database_yaml;

  const auto config = ConfigLoader::LoadFromYamlString(yaml);
  const auto key    = recsync::factory::LoadOrCreateMasterKey(config);

  std::string host_id;
  {
    auto rt = recsync::factory::BuildRuntime(config);
    host_id = rt.host_id;
    rt.kv->Set(rt.host_id, key, "editor", "vim");
    rt.kv->Set(rt.host_id, key, "editor", "helix");
    assert(rt.kv->Get(rt.host_id, key, "editor") == std::string("helix"));
  }

  if (!config.database().has_sqlite()) return;

  // A second process on the same files sees the same host and data.
  auto rt = recsync::factory::BuildRuntime(config);
  assert(rt.host_id == host_id);
  assert(rt.kv->Get(rt.host_id, key, "editor") == std::string("helix"));
  assert(rt.kv->Scan(rt.host_id, key, "editor") == std::string("helix"));
}

} // namespace

int main() {
  TestHostIdIsGeneratedOnce();
  TestMasterKeyNeedsPath();
  TestEncryptorAndRelayFromConfig();
  TestRuntimeRoundTrip("database:\n  memory: {}\n");
#if RECSYNC_DB_SQLITE
  TestRuntimeRoundTrip("database:\n  sqlite:\n    path: " +
                       (std::filesystem::temp_directory_path() / "recsync_factory_tests" / "runtime" / "records.db").string() +
                       "\n    wal_mode: true\n");
#endif

  std::cout << "recsync_unit_factory: pass\n";
  return 0;
}
