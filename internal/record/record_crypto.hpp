#pragma once

#include "internal/crypto/encryptor.hpp"
#include "internal/crypto/secret_key.hpp"
#include "internal/model/record.hpp"

namespace recsync::record {

// Identity fields are copied verbatim; only the data changes form.
model::EncryptedRecord EncryptRecord(const crypto::Encryptor& encryptor, const model::DecryptedRecord& record, const crypto::SecretKey& key);

// Throws util::AuthenticationFailure if the record or its identity was altered.
model::DecryptedRecord DecryptRecord(const crypto::Encryptor& encryptor, const model::EncryptedRecord& record, const crypto::SecretKey& key);

model::EncryptedRecord ReEncryptRecord(const crypto::Encryptor& encryptor, const model::EncryptedRecord& record,
                                       const crypto::SecretKey& old_key, const crypto::SecretKey& new_key);

} // namespace recsync::record
