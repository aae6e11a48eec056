#pragma once

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>

#include "internal/crypto/encryptor.hpp"
#include "internal/crypto/secret_key.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/relay/relay_client.hpp"

namespace recsync::sync {

struct SyncOptions {
  // Category to sync; empty syncs every category.
  std::string scope;
  uint32_t    page_size = 100;
  // Decrypt each downloaded record before storing it and drop the ones that
  // fail authentication.
  bool verify_downloads = false;
};

struct SyncReport {
  uint64_t    downloaded   = 0;
  uint64_t    uploaded     = 0;
  uint64_t    rejected     = 0;
  uint64_t    local_count  = 0;
  uint64_t    remote_count = 0;
  bool        cancelled    = false;
  std::string error;

  bool Ok() const {
    return !cancelled && error.empty();
  }
};

/*
  Reconciles the local store with a relay.

  Download pulls pages until the local count catches up with the relay,
  upload pushes local records newest first until the relay catches up.
  Every page and batch commits on its own, so a cancelled or failed run
  keeps what it already transferred. The scope's last_sync watermark is the
  relay's ingest watermark read at the start of the run, and only moves after
  a complete run.
*/
class SyncService {
 public:
  SyncService(std::shared_ptr<db::RecordStore> store, std::shared_ptr<relay::RelayClient> relay,
              std::shared_ptr<const crypto::Encryptor> encryptor);

  // Transport and store failures end the run and land in SyncReport::error.
  SyncReport Sync(const crypto::SecretKey& master_key, const SyncOptions& options, std::stop_token stop = {});

 private:
  uint64_t LocalCount(const std::string& scope);

  void Download(const crypto::SecretKey& master_key, const SyncOptions& options, uint64_t last_sync_ns, const std::stop_token& stop,
                SyncReport& report);
  void Upload(const SyncOptions& options, const std::stop_token& stop, SyncReport& report);

  std::shared_ptr<db::RecordStore>         store_;
  std::shared_ptr<relay::RelayClient>      relay_;
  std::shared_ptr<const crypto::Encryptor> encryptor_;
};

} // namespace recsync::sync
