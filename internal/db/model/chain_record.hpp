#pragma once

#include <cstdint>
#include <string>

namespace recsync::db::model {

struct ChainRecord {
  std::string host_id;
  std::string category;
  uint64_t    length = 0;
};

} // namespace recsync::db::model
