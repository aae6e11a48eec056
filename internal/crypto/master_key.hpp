#pragma once

#include <string>
#include <string_view>

#include "internal/crypto/secret_key.hpp"

namespace recsync::crypto {

/*
  Master key file: the base64 encoding of 32 random bytes on one line,
  readable only by the owner.
*/

std::string EncodeKey(const SecretKey& key);
SecretKey   DecodeKey(std::string_view text);

SecretKey LoadKey(const std::string& path);

// Fails if the file already exists.
void WriteKeyFile(const std::string& path, const SecretKey& key);

SecretKey LoadOrCreateKey(const std::string& path);

} // namespace recsync::crypto
