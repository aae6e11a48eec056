#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "internal/crypto/envelope.hpp"
#include "internal/crypto/secret_key.hpp"

namespace recsync::crypto {

enum class Scheme {
  kAes256Gcm,
  kChaCha20Poly1305,
};

// Accepts "aes-256-gcm" and "chacha20-poly1305".
Scheme ParseScheme(std::string_view name);

/*
  Envelope encryption engine.

  New records are sealed with the scheme chosen at construction. Decryption
  picks the scheme from the token header, so a store may hold records
  written under either scheme.
*/
class Encryptor {
 public:
  explicit Encryptor(Scheme scheme = Scheme::kAes256Gcm);

  EncryptedBlob Encrypt(std::string_view plaintext, const AdditionalData& ad, const SecretKey& master_key) const;
  std::string   Decrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& master_key) const;
  EncryptedBlob ReEncrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& old_key, const SecretKey& new_key) const;

  // True if the blob's CEK is wrapped under `key`. Never throws; a malformed
  // footer is simply not wrapped with anything.
  static bool IsWrappedWith(const EncryptedBlob& blob, const SecretKey& key);

  std::string_view SchemeName() const;

 private:
  using SchemeVariant = std::variant<EnvelopeScheme<Aes256Gcm>, EnvelopeScheme<ChaCha20Poly1305>>;

  static SchemeVariant SchemeFor(const EncryptedBlob& blob);

  SchemeVariant scheme_;
};

} // namespace recsync::crypto
