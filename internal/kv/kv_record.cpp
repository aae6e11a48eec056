#include "internal/kv/kv_record.hpp"

#include "internal/util/errors.hpp"
#include "recsync/record/v1/record.pb.h"

namespace recsync::kv {

std::string EncodeKvRecord(const KvRecord& record) {
  recsync::record::v1::KvRecord proto;
  proto.set_key(record.key);
  proto.set_value(record.value);

  std::string bytes;
  if (!proto.SerializeToString(&bytes)) {
    throw util::SerializationFailure("failed to encode kv record");
  }
  return bytes;
}

KvRecord DecodeKvRecord(std::string_view version, std::string_view bytes) {
  if (version != kKvVersion) {
    throw util::SerializationFailure("unsupported kv record version: " + std::string(version));
  }

  recsync::record::v1::KvRecord proto;
  if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    throw util::SerializationFailure("malformed kv record");
  }
  return {proto.key(), proto.value()};
}

} // namespace recsync::kv
