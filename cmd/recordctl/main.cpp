#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/crypto/master_key.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/record/chain.hpp"
#include "internal/record/key_rotation.hpp"
#include "internal/sync/sync_service.hpp"

namespace factory = recsync::factory;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  recordctl --config <file> kv set <key> <value>\n"
            << "  recordctl --config <file> kv get <key>\n"
            << "  recordctl --config <file> kv list\n"
            << "  recordctl --config <file> sync\n"
            << "  recordctl --config <file> verify\n"
            << "  recordctl --config <file> rotate-key <new_key_file>\n"
            << "  recordctl --config <file> status\n"
            << "  recordctl key new <path>\n";
}

static int RunKv(const factory::Runtime& rt, const recsync::crypto::SecretKey& key, int argc, char** argv, int at) {
  if (argc <= at) {
    Usage();
    return 1;
  }

  const std::string op = argv[at];
  if (op == "set" && argc == at + 3) {
    const auto id = rt.kv->Set(rt.host_id, key, argv[at + 1], argv[at + 2]);
    std::cout << "record=" << id << "\n";
    return 0;
  }
  if (op == "get" && argc == at + 2) {
    const auto value = rt.kv->Get(rt.host_id, key, argv[at + 1]);
    if (!value) {
      std::cerr << "not found: " << argv[at + 1] << "\n";
      return 3;
    }
    std::cout << *value << "\n";
    return 0;
  }
  if (op == "list" && argc == at + 1) {
    for (const auto& [k, v] : rt.kv->List(rt.host_id, key)) {
      std::cout << k << "=" << v << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

static int RunSync(const recsync::runtime::config::RuntimeConfig& config, const factory::Runtime& rt, const recsync::crypto::SecretKey& key) {
  recsync::sync::SyncService sync(rt.store, factory::BuildRelayClient(config), rt.encryptor);
  const auto                 options = factory::BuildSyncOptions(config);

  recsync::sync::SyncReport report;
  std::atomic<bool>         done{false};
  std::jthread              worker([&](std::stop_token stop) {
    report = sync.Sync(key, options, stop);
    done   = true;
  });

  while (!done) {
    if (!g_running) worker.request_stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  worker.join();

  std::cout << "downloaded=" << report.downloaded << " uploaded=" << report.uploaded << " rejected=" << report.rejected
            << " local=" << report.local_count << " remote=" << report.remote_count << "\n";
  if (report.cancelled) {
    std::cerr << "sync cancelled\n";
    return 3;
  }
  if (!report.error.empty()) {
    std::cerr << report.error << "\n";
    return 2;
  }
  return 0;
}

static int RunVerify(const factory::Runtime& rt) {
  std::vector<recsync::db::model::ChainRecord> chains;
  {
    auto tx = rt.store->Begin();
    chains  = rt.store->Chains(*tx);
    tx->Commit();
  }

  int broken = 0;
  for (const auto& chain : chains) {
    const auto report = recsync::record::VerifyChain(*rt.store, chain.host_id, chain.category);
    std::cout << chain.host_id << "/" << chain.category << " length=" << report.length << " walked=" << report.walked
              << (report.Ok() ? " ok" : " BROKEN") << "\n";
    for (const auto& problem : report.problems) {
      std::cout << "  " << problem << "\n";
    }
    if (!report.Ok()) ++broken;
  }
  return broken == 0 ? 0 : 3;
}

static int RunRotate(const recsync::runtime::config::RuntimeConfig& config, const factory::Runtime& rt, const recsync::crypto::SecretKey& old_key,
                     const std::string& new_key_path) {
  const auto new_key = recsync::crypto::LoadOrCreateKey(new_key_path);
  const auto report  = recsync::record::RotateMasterKey(*rt.store, *rt.encryptor, old_key, new_key, factory::BuildSyncOptions(config).page_size);

  std::cout << "rotated=" << report.rotated << " already_rotated=" << report.already_rotated << " failed=" << report.failed.size() << "\n";
  if (!report.failed.empty()) {
    for (const auto& id : report.failed) {
      std::cerr << "failed: " << id << "\n";
    }
    std::cerr << "key file left unchanged\n";
    return 3;
  }

  // Every record now opens with the new key; it takes the old key's place.
  std::filesystem::rename(new_key_path, config.key().path());
  std::cout << "key " << config.key().path() << " replaced\n";
  return 0;
}

static int RunStatus(const recsync::runtime::config::RuntimeConfig& config, const factory::Runtime& rt) {
  const auto scope = config.relay().scope();

  auto       tx     = rt.store->Begin();
  const auto chains = rt.store->Chains(*tx);
  const auto count  = rt.store->Count(*tx, scope);
  const auto state  = rt.store->GetSyncState(*tx, scope);
  tx->Commit();

  std::cout << "host=" << rt.host_id << "\n"
            << "scheme=" << rt.encryptor->SchemeName() << "\n"
            << "records=" << count << "\n"
            << "last_sync_ns=" << (state ? state->last_sync_ns : 0) << "\n";
  for (const auto& chain : chains) {
    std::cout << "chain " << chain.host_id << "/" << chain.category << " length=" << chain.length << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc == 4 && std::string(argv[1]) == "key" && std::string(argv[2]) == "new") {
    try {
      recsync::crypto::WriteKeyFile(argv[3], recsync::crypto::SecretKey::Generate());
      std::cout << "wrote " << argv[3] << "\n";
      return 0;
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return 2;
    }
  }

  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = recsync::config::ConfigLoader::LoadFromYaml(config_path);

    recsync::observability::InitializeLogging(config);
    recsync::observability::InitializeTracing(config);
    recsync::observability::InitializeMetrics(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto       rt  = factory::BuildRuntime(config);
    const auto key = factory::LoadOrCreateMasterKey(config);

    int rc = 1;
    if (cmd == "kv") {
      rc = RunKv(rt, key, argc, argv, 4);
    } else if (cmd == "sync" && argc == 4) {
      rc = RunSync(config, rt, key);
    } else if (cmd == "verify" && argc == 4) {
      rc = RunVerify(rt);
    } else if (cmd == "rotate-key" && argc == 5) {
      rc = RunRotate(config, rt, key, argv[4]);
    } else if (cmd == "status" && argc == 4) {
      rc = RunStatus(config, rt);
    } else {
      Usage();
    }

    recsync::observability::ShutdownLogging();
    recsync::observability::ShutdownMetrics();
    recsync::observability::ShutdownTracing();
    return rc;
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("command failed", {recsync::observability::StringField("command", cmd), recsync::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    recsync::observability::ShutdownLogging();
    recsync::observability::ShutdownMetrics();
    recsync::observability::ShutdownTracing();
    return 2;
  }
}
