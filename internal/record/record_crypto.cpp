#include "internal/record/record_crypto.hpp"

namespace recsync::record {

namespace {

template <typename To, typename From, typename Data>
To WithData(const From& from, Data data) {
  To to;
  to.id           = from.id;
  to.host_id      = from.host_id;
  to.parent       = from.parent;
  to.category     = from.category;
  to.version      = from.version;
  to.timestamp_ns = from.timestamp_ns;
  to.data         = std::move(data);
  return to;
}

} // namespace

model::EncryptedRecord EncryptRecord(const crypto::Encryptor& encryptor, const model::DecryptedRecord& record, const crypto::SecretKey& key) {
  return WithData<model::EncryptedRecord>(record, encryptor.Encrypt(record.data.bytes, record.Additional(), key));
}

model::DecryptedRecord DecryptRecord(const crypto::Encryptor& encryptor, const model::EncryptedRecord& record, const crypto::SecretKey& key) {
  return WithData<model::DecryptedRecord>(record, model::DecryptedData{encryptor.Decrypt(record.data, record.Additional(), key)});
}

model::EncryptedRecord ReEncryptRecord(const crypto::Encryptor& encryptor, const model::EncryptedRecord& record,
                                       const crypto::SecretKey& old_key, const crypto::SecretKey& new_key) {
  return WithData<model::EncryptedRecord>(record, encryptor.ReEncrypt(record.data, record.Additional(), old_key, new_key));
}

} // namespace recsync::record
