#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace recsync::util {

/*
  Base64 codecs built on OpenSSL's block encoder.

  The URL-safe variant uses '-' and '_' and carries no padding; it is the form
  every token and footer field is written in. Its decoder accepts exactly what
  the encoder produces: no whitespace, no padding, no stray trailing bits.
*/

std::string                Base64Encode(std::string_view bytes);
std::optional<std::string> Base64Decode(std::string_view text);

std::string                Base64UrlEncode(std::string_view bytes);
std::optional<std::string> Base64UrlDecode(std::string_view text);

} // namespace recsync::util
