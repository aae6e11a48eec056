#include "base64.hpp"

#include <openssl/evp.h>

#include <algorithm>

namespace recsync::util {

std::string Base64Encode(std::string_view bytes) {
  if (bytes.empty()) {
    return {};
  }

  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::optional<std::string> Base64Decode(std::string_view text) {
  if (text.empty()) {
    return std::string{};
  }
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }

  std::string out(3 * text.size() / 4, '\0');
  const int   written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
  if (written < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  size_t padding = 0;
  if (text.back() == '=') ++padding;
  if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;

  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

std::string Base64UrlEncode(std::string_view bytes) {
  std::string out = Base64Encode(bytes);
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  return out;
}

namespace {

bool IsUrlAlphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

std::optional<std::string> Base64UrlDecode(std::string_view text) {
  std::string standard;
  standard.reserve(text.size() + 2);
  for (char c : text) {
    // EVP_DecodeBlock would skip whitespace and accept '+', '/' and '='.
    if (!IsUrlAlphabet(c)) {
      return std::nullopt;
    }
    standard.push_back(c == '-' ? '+' : c == '_' ? '/' : c);
  }
  if (standard.size() % 4 == 1) {
    return std::nullopt;
  }
  while (standard.size() % 4 != 0) {
    standard.push_back('=');
  }

  auto decoded = Base64Decode(standard);
  // One spelling per value: the unused low bits of the last character must be zero.
  if (!decoded || Base64UrlEncode(*decoded) != text) {
    return std::nullopt;
  }
  return decoded;
}

} // namespace recsync::util
