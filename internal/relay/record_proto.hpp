#pragma once

#include "internal/model/record.hpp"
#include "recsync/record/v1/record.pb.h"

namespace recsync::relay {

recsync::record::v1::EncryptedRecord ToProto(const model::EncryptedRecord& record);

// Throws util::SerializationFailure if required identity fields are missing.
model::EncryptedRecord FromProto(const recsync::record::v1::EncryptedRecord& proto);

} // namespace recsync::relay
