#include "internal/sync/sync_service.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/record/record_crypto.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace recsync::sync {

using observability::StringField;
using observability::UintField;

SyncService::SyncService(std::shared_ptr<db::RecordStore> store, std::shared_ptr<relay::RelayClient> relay,
                         std::shared_ptr<const crypto::Encryptor> encryptor)
    : store_(std::move(store)), relay_(std::move(relay)), encryptor_(std::move(encryptor)) {
}

uint64_t SyncService::LocalCount(const std::string& scope) {
  auto       tx    = store_->Begin();
  const auto count = store_->Count(*tx, scope);
  tx->Commit();
  return count;
}

SyncReport SyncService::Sync(const crypto::SecretKey& master_key, const SyncOptions& options, std::stop_token stop) {
  observability::SpanScope span("sync.run");
  span.SetAttribute("sync.scope", options.scope);

  const auto started_at = std::chrono::steady_clock::now();

  SyncReport report;
  try {
    uint64_t last_sync_ns = 0;
    {
      auto tx = store_->Begin();
      if (const auto state = store_->GetSyncState(*tx, options.scope)) {
        last_sync_ns = state->last_sync_ns;
      }
      tx->Commit();
    }

    // last_sync stays on the relay's clock. Records ingested during this run
    // land above the watermark and come down next time.
    const uint64_t watermark_ns = relay_->Watermark();

    report.local_count  = LocalCount(options.scope);
    report.remote_count = relay_->Count(options.scope);

    Download(master_key, options, last_sync_ns, stop, report);
    if (!report.cancelled) {
      Upload(options, stop, report);
    }

    if (!report.cancelled) {
      auto tx = store_->Begin();
      db::ThrowIfError(store_->CommitSyncState(*tx, {options.scope, watermark_ns, util::NowNanos()}), "commit sync state");
      tx->Commit();
    }
  } catch (const util::TransportFailure& ex) {
    report.error = ex.what();
  } catch (const util::StoreIoFailure& ex) {
    report.error = ex.what();
  } catch (const util::Conflict& ex) {
    report.error = ex.what();
  }

  span.SetAttribute("sync.downloaded", static_cast<std::int64_t>(report.downloaded));
  span.SetAttribute("sync.uploaded", static_cast<std::int64_t>(report.uploaded));

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordSyncRecords("download", report.downloaded);
  metrics.RecordSyncRecords("upload", report.uploaded);
  metrics.RecordSyncRecords("rejected", report.rejected);
  metrics.ObserveSyncDurationMs(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  if (!report.error.empty()) {
    span.RecordException(report.error);
    RECSYNC_LOG_ERROR("sync failed", {StringField("scope", options.scope), StringField("error", report.error),
                                      UintField("downloaded", report.downloaded), UintField("uploaded", report.uploaded)});
  } else {
    RECSYNC_LOG_INFO("sync finished", {StringField("scope", options.scope), UintField("downloaded", report.downloaded),
                                       UintField("uploaded", report.uploaded), UintField("rejected", report.rejected),
                                       observability::BoolField("cancelled", report.cancelled)});
  }
  return report;
}

void SyncService::Download(const crypto::SecretKey& master_key, const SyncOptions& options, uint64_t last_sync_ns,
                           const std::stop_token& stop, SyncReport& report) {
  uint64_t after_ns = 0;
  bool     reset    = false;
  uint64_t local_at_reset = 0;

  while (report.remote_count > report.local_count) {
    if (stop.stop_requested()) {
      report.cancelled = true;
      return;
    }

    auto page = relay_->FetchPage({options.scope, last_sync_ns, after_ns, options.page_size});
    if (page.empty()) break;

    const uint64_t page_last_ns = page.back().timestamp_ns;

    std::vector<model::EncryptedRecord> accepted;
    accepted.reserve(page.size());
    for (auto& record : page) {
      if (options.verify_downloads) {
        try {
          (void)record::DecryptRecord(*encryptor_, record, master_key);
        } catch (const util::AuthenticationFailure&) {
          ++report.rejected;
          RECSYNC_LOG_WARN("rejected downloaded record", {StringField("record_id", record.id), StringField("host_id", record.host_id)});
          continue;
        }
      }
      accepted.push_back(std::move(record));
    }

    uint64_t inserted = 0;
    {
      auto tx = store_->Begin();
      db::ThrowIfError(store_->SaveBatch(*tx, accepted, inserted), "save downloaded page");
      tx->Commit();
    }
    report.downloaded += inserted;
    report.local_count = LocalCount(options.scope);

    RECSYNC_LOG_DEBUG("downloaded page", {UintField("records", page.size()), UintField("inserted", inserted),
                                          UintField("local_count", report.local_count)});

    if (page_last_ns != after_ns) {
      after_ns = page_last_ns;
      continue;
    }

    // The cursor stopped moving: rescan from the epoch, but only once per
    // round of local progress.
    if (reset && report.local_count == local_at_reset) {
      RECSYNC_LOG_WARN("download made no progress", {UintField("local_count", report.local_count),
                                                     UintField("remote_count", report.remote_count)});
      break;
    }
    reset          = true;
    local_at_reset = report.local_count;
    after_ns       = 0;
  }
}

void SyncService::Upload(const SyncOptions& options, const std::stop_token& stop, SyncReport& report) {
  auto cursor = db::model::RecordCursor::Newest();

  while (report.local_count > report.remote_count) {
    if (stop.stop_requested()) {
      report.cancelled = true;
      return;
    }

    std::vector<model::EncryptedRecord> batch;
    {
      auto tx = store_->Begin();
      batch   = store_->Before(*tx, options.scope, cursor, options.page_size);
      tx->Commit();
    }
    if (batch.empty()) break;

    report.uploaded += relay_->PostBatch(batch);
    cursor              = {batch.back().timestamp_ns, batch.back().id};
    report.remote_count = relay_->Count(options.scope);

    RECSYNC_LOG_DEBUG("uploaded batch", {UintField("records", batch.size()), UintField("remote_count", report.remote_count)});
  }
}

} // namespace recsync::sync
