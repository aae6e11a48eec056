#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/crypto/envelope.hpp"

namespace recsync::model {

/*
  One entry in a (host_id, category) chain.

  Records are immutable once pushed; the only field ever rewritten is the
  wrapped content key of an encrypted record during master key rotation.
*/

struct DecryptedData {
  std::string bytes;

  bool operator==(const DecryptedData&) const = default;
};

using EncryptedData = crypto::EncryptedBlob;

template <typename Data>
struct Record {
  std::string id;
  std::string host_id;
  // Absent for the head of a chain.
  std::optional<std::string> parent;
  std::string category;
  std::string version;
  uint64_t    timestamp_ns = 0;
  Data        data;

  crypto::AdditionalData Additional() const {
    return {id, version, category, host_id};
  }

  bool operator==(const Record&) const = default;
};

using DecryptedRecord = Record<DecryptedData>;
using EncryptedRecord = Record<EncryptedData>;

} // namespace recsync::model
