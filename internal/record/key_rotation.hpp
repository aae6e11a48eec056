#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/crypto/encryptor.hpp"
#include "internal/crypto/secret_key.hpp"
#include "internal/db/api/record_store.hpp"

namespace recsync::record {

struct RotationReport {
  uint64_t rotated = 0;
  // Already wrapped under the new key (a resumed rotation).
  uint64_t already_rotated = 0;
  // Ids that failed authentication under the old key and were left as is.
  std::vector<std::string> failed;
};

/*
  Re-wraps the content key of every record in the store under new_key.
  Ciphertext is never touched. Safe to re-run after an interruption.
*/
RotationReport RotateMasterKey(db::RecordStore& store, const crypto::Encryptor& encryptor, const crypto::SecretKey& old_key,
                               const crypto::SecretKey& new_key, uint32_t page_size = 100);

} // namespace recsync::record
