#include "internal/crypto/secret_key.hpp"

#include <openssl/crypto.h>

#include <cstring>
#include <stdexcept>
#include <string>

#include "internal/crypto/openssl_util.hpp"

namespace recsync::crypto {

SecretKey::SecretKey(std::string_view bytes) {
  if (bytes.size() != kKeySize) {
    throw std::invalid_argument("key must be " + std::to_string(kKeySize) + " bytes, got " + std::to_string(bytes.size()));
  }
  std::memcpy(bytes_.data(), bytes.data(), kKeySize);
}

SecretKey::~SecretKey() {
  OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

SecretKey SecretKey::Generate() {
  std::string random = RandomBytes(kKeySize);
  SecretKey   key(random);
  OPENSSL_cleanse(random.data(), random.size());
  return key;
}

bool SecretKey::operator==(const SecretKey& other) const {
  return ConstantTimeEquals(View(), other.View());
}

} // namespace recsync::crypto
