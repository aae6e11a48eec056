#include "internal/relay/record_proto.hpp"

#include "internal/util/errors.hpp"

namespace recsync::relay {

recsync::record::v1::EncryptedRecord ToProto(const model::EncryptedRecord& record) {
  recsync::record::v1::EncryptedRecord proto;
  proto.set_id(record.id);
  proto.set_host_id(record.host_id);
  if (record.parent) proto.set_parent(*record.parent);
  proto.set_category(record.category);
  proto.set_version(record.version);
  proto.set_timestamp_ns(record.timestamp_ns);
  proto.set_data(record.data.data);
  proto.set_content_encryption_key(record.data.content_encryption_key);
  return proto;
}

model::EncryptedRecord FromProto(const recsync::record::v1::EncryptedRecord& proto) {
  if (proto.id().empty() || proto.host_id().empty() || proto.category().empty()) {
    throw util::SerializationFailure("record is missing id, host_id or category");
  }

  model::EncryptedRecord record;
  record.id       = proto.id();
  record.host_id  = proto.host_id();
  if (!proto.parent().empty()) record.parent = proto.parent();
  record.category                    = proto.category();
  record.version                     = proto.version();
  record.timestamp_ns                = proto.timestamp_ns();
  record.data.data                   = proto.data();
  record.data.content_encryption_key = proto.content_encryption_key();
  return record;
}

} // namespace recsync::relay
