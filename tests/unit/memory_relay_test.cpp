#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/relay/memory_relay.hpp"
#include "internal/relay/record_proto.hpp"
#include "internal/util/errors.hpp"

namespace {

using recsync::model::EncryptedRecord;
using recsync::relay::MemoryRelay;
using recsync::relay::PageRequest;

EncryptedRecord MakeRecord(const std::string& id, uint64_t ts, const std::string& category = "kv") {
  EncryptedRecord r;
  r.id                          = id;
  r.host_id                     = "host";
  r.category                    = category;
  r.version                     = "v0";
  r.timestamp_ns                = ts;
  r.data.data                   = "token-" + id;
  r.data.content_encryption_key = "{}";
  return r;
}

std::vector<std::string> Ids(const std::vector<EncryptedRecord>& records) {
  std::vector<std::string> out;
  for (const auto& r : records) out.push_back(r.id);
  return out;
}

void TestPostIsIdempotent() {
  MemoryRelay relay;
  assert(relay.PostBatch({MakeRecord("a", 10), MakeRecord("b", 20)}) == 2);
  assert(relay.PostBatch({MakeRecord("a", 10), MakeRecord("c", 30)}) == 1);
  assert(relay.Count("") == 3);
  assert(relay.PostBatch({}) == 0);
}

void TestPagesAreOrderedAndFiltered() {
  MemoryRelay relay;
  relay.PostBatch({MakeRecord("d", 30), MakeRecord("b", 20), MakeRecord("a", 10), MakeRecord("c", 20), MakeRecord("h", 15, "history")});

  assert(relay.Count("kv") == 4);
  assert(relay.Count("history") == 1);
  assert(relay.Count("nothing") == 0);

  const auto all = relay.FetchPage({"", 0, 0, 100});
  assert((Ids(all) == std::vector<std::string>{"a", "h", "b", "c", "d"}));

  // after_timestamp is inclusive.
  const auto from20 = relay.FetchPage({"kv", 0, 20, 100});
  assert((Ids(from20) == std::vector<std::string>{"b", "c", "d"}));

  const auto limited = relay.FetchPage({"kv", 0, 0, 2});
  assert((Ids(limited) == std::vector<std::string>{"a", "b"}));
}

void TestLastSyncFiltersByIngestTime() {
  MemoryRelay relay;
  relay.PostBatch({MakeRecord("old", 50)});
  const auto watermark = relay.IngestTime("old") + 1;
  relay.PostBatch({MakeRecord("new", 5)});

  assert(relay.IngestTime("new") >= watermark);
  assert(relay.IngestTime("missing") == 0);

  // A record with an older timestamp but a later arrival is still returned.
  const auto page = relay.FetchPage({"", watermark, 0, 100});
  assert((Ids(page) == std::vector<std::string>{"new"}));
}

// Ingest times come from the relay's clock, even one that stands still.
void TestWatermarkFollowsRelayClock() {
  MemoryRelay relay([] { return uint64_t{1000}; });
  assert(relay.Watermark() == 0);

  relay.PostBatch({MakeRecord("a", 99999), MakeRecord("b", 1)});
  assert(relay.IngestTime("a") == 1000);
  assert(relay.IngestTime("b") == 1001);
  assert(relay.Watermark() == 1001);

  relay.PostBatch({MakeRecord("a", 99999)});
  assert(relay.Watermark() == 1001);

  relay.PostBatch({MakeRecord("c", 7)});
  assert(relay.IngestTime("c") > 1001);
  const auto page = relay.FetchPage({"", 1002, 0, 100});
  assert((Ids(page) == std::vector<std::string>{"c"}));
}

void TestProtoConversion() {
  auto record   = MakeRecord("p", 42);
  record.parent = "parent-id";

  const auto proto = recsync::relay::ToProto(record);
  assert(proto.parent() == "parent-id");
  assert(proto.timestamp_ns() == 42);
  assert(recsync::relay::FromProto(proto) == record);

  const auto head = MakeRecord("head", 1);
  assert(!recsync::relay::FromProto(recsync::relay::ToProto(head)).parent.has_value());

  auto broken = proto;
  broken.clear_host_id();
  bool threw = false;
  try {
    (void)recsync::relay::FromProto(broken);
  } catch (const recsync::util::SerializationFailure&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPostIsIdempotent();
  TestPagesAreOrderedAndFiltered();
  TestLastSyncFiltersByIngestTime();
  TestWatermarkFollowsRelayClock();
  TestProtoConversion();

  std::cout << "recsync_unit_memory_relay: pass\n";
  return 0;
}
