#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/util/base64.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace recsync::util;

void TestBase64UrlIsUnpaddedAndUrlSafe() {
  const std::string bytes("\xfb\xff\xfe", 3);
  const auto        encoded = Base64UrlEncode(bytes);
  assert(encoded == "-__-");
  assert(Base64UrlDecode(encoded) == bytes);

  assert(Base64UrlEncode("a") == "YQ");
  assert(Base64UrlDecode("YQ") == std::string("a"));
  assert(Base64UrlDecode("") == std::string());
}

void TestBase64UrlRejectsStandardAlphabet() {
  assert(!Base64UrlDecode("+//+").has_value());
  assert(!Base64UrlDecode("YQ==").has_value());
  assert(!Base64UrlDecode("Y").has_value());
}

void TestBase64UrlHasOneSpellingPerValue() {
  assert(Base64UrlDecode("QQ") == std::string("A"));
  // Same byte with non-zero leftover bits.
  assert(!Base64UrlDecode("QR").has_value());
  assert(Base64UrlDecode("QUI") == std::string("AB"));
  assert(!Base64UrlDecode("QUJ").has_value());

  assert(!Base64UrlDecode(" YQ").has_value());
  assert(!Base64UrlDecode("YQ ").has_value());
  assert(!Base64UrlDecode("YW\nJj").has_value());
  assert(!Base64UrlDecode("YW\tJj").has_value());
  assert(!Base64UrlDecode("YW.Jj").has_value());
  assert(!Base64UrlDecode(std::string_view("YW\0J", 4)).has_value());

  const std::string bytes("\xfb\xff\x00\x7e", 4);
  assert(Base64UrlDecode(Base64UrlEncode(bytes)) == bytes);
}

void TestBase64Standard() {
  assert(Base64Encode("hello") == "aGVsbG8=");
  assert(Base64Decode("aGVsbG8=") == std::string("hello"));
  assert(!Base64Decode("not base64!").has_value());
}

void TestUuidFormatting() {
  const auto id = NewHostId();
  assert(id.size() == 36);
  assert(IsUUID(id));
  assert(ToString(FromString(id)) == id);
  assert(id[14] == '4');

  assert(!IsUUID("not-a-uuid"));
  bool threw = false;
  try {
    (void)FromString("zz");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRecordIdsAreTimeOrderedV7() {
  std::set<std::string> seen;
  std::string           previous;
  for (int i = 0; i < 64; ++i) {
    const auto id = NewRecordId();
    assert(IsUUID(id));
    assert(id[14] == '7');
    assert(seen.insert(id).second);
    // Millisecond prefix never goes backwards.
    assert(previous.empty() || id.substr(0, 13) >= previous.substr(0, 13));
    previous = id;
  }
}

void TestTimeConversions() {
  const auto tp = FromUnixNanos(1'700'000'000'123'456'789ULL);
  assert(ToUnixNanos(tp) == 1'700'000'000'123'456'789ULL);
  assert(ToUnixMillis(tp) == 1'700'000'000'123ULL);
  assert(NowNanos() > 1'600'000'000'000'000'000ULL);
}

} // namespace

int main() {
  TestBase64UrlIsUnpaddedAndUrlSafe();
  TestBase64UrlRejectsStandardAlphabet();
  TestBase64UrlHasOneSpellingPerValue();
  TestBase64Standard();
  TestUuidFormatting();
  TestRecordIdsAreTimeOrderedV7();
  TestTimeConversions();

  std::cout << "recsync_unit_util: pass\n";
  return 0;
}
