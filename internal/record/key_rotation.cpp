#include "internal/record/key_rotation.hpp"

#include "internal/observability/logging.hpp"
#include "internal/record/record_crypto.hpp"
#include "internal/util/errors.hpp"

namespace recsync::record {

RotationReport RotateMasterKey(db::RecordStore& store, const crypto::Encryptor& encryptor, const crypto::SecretKey& old_key,
                               const crypto::SecretKey& new_key, uint32_t page_size) {
  RotationReport report;
  uint64_t       offset = 0;

  for (;;) {
    auto tx   = store.Begin();
    auto page = store.Page(*tx, offset, page_size);
    if (page.empty()) {
      tx->Commit();
      break;
    }

    for (const auto& record : page) {
      if (crypto::Encryptor::IsWrappedWith(record.data, new_key)) {
        ++report.already_rotated;
        continue;
      }
      try {
        const auto rotated = ReEncryptRecord(encryptor, record, old_key, new_key);
        db::ThrowIfError(store.UpdateWrappedKey(*tx, record.id, rotated.data.content_encryption_key), "rotate record " + record.id);
        ++report.rotated;
      } catch (const util::AuthenticationFailure&) {
        report.failed.push_back(record.id);
        RECSYNC_LOG_WARN("record failed authentication during key rotation", {observability::StringField("id", record.id)});
      }
    }

    tx->Commit();
    offset += page.size();
  }

  RECSYNC_LOG_INFO("master key rotation finished",
                   {observability::UintField("rotated", report.rotated), observability::UintField("already_rotated", report.already_rotated),
                    observability::UintField("failed", report.failed.size())});
  return report;
}

} // namespace recsync::record
