#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/crypto/secret_key.hpp"

namespace recsync::crypto {

// AES-256 key wrap (RFC 3394). Deterministic; a wrapped 32-byte key is 40 bytes.
inline constexpr std::size_t kWrappedKeySize = kKeySize + 8;

std::string              WrapKey(const SecretKey& kek, const SecretKey& cek);
std::optional<SecretKey> UnwrapKey(const SecretKey& kek, std::string_view wrapped);

// Public identifier of a master key: "rs1.kid." + base64url(SHA-256 prefix).
std::string KeyId(const SecretKey& kek);

} // namespace recsync::crypto
