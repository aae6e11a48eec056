#pragma once

#include <string>
#include <string_view>

namespace recsync::kv {

inline constexpr std::string_view kKvVersion  = "v0";
inline constexpr std::string_view kKvCategory = "kv";

struct KvRecord {
  std::string key;
  std::string value;
};

std::string EncodeKvRecord(const KvRecord& record);

// Throws util::SerializationFailure for a payload that is not a KvRecord or
// a version this build does not read.
KvRecord DecodeKvRecord(std::string_view version, std::string_view bytes);

} // namespace recsync::kv
