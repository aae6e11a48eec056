#include "internal/crypto/encryptor.hpp"

#include "internal/util/errors.hpp"

namespace recsync::crypto {

Scheme ParseScheme(std::string_view name) {
  if (name.empty() || name == Aes256Gcm::kName) {
    return Scheme::kAes256Gcm;
  }
  if (name == ChaCha20Poly1305::kName) {
    return Scheme::kChaCha20Poly1305;
  }
  throw util::SerializationFailure("unknown encryption scheme: " + std::string(name));
}

Encryptor::Encryptor(Scheme scheme) {
  switch (scheme) {
    case Scheme::kAes256Gcm:
      scheme_ = EnvelopeScheme<Aes256Gcm>{};
      break;
    case Scheme::kChaCha20Poly1305:
      scheme_ = EnvelopeScheme<ChaCha20Poly1305>{};
      break;
  }
}

Encryptor::SchemeVariant Encryptor::SchemeFor(const EncryptedBlob& blob) {
  if (EnvelopeScheme<ChaCha20Poly1305>::Owns(blob.data)) {
    return EnvelopeScheme<ChaCha20Poly1305>{};
  }
  if (EnvelopeScheme<Aes256Gcm>::Owns(blob.data)) {
    return EnvelopeScheme<Aes256Gcm>{};
  }
  throw util::AuthenticationFailure();
}

EncryptedBlob Encryptor::Encrypt(std::string_view plaintext, const AdditionalData& ad, const SecretKey& master_key) const {
  return std::visit([&](const auto& scheme) { return scheme.Encrypt(plaintext, ad, master_key); }, scheme_);
}

std::string Encryptor::Decrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& master_key) const {
  return std::visit([&](const auto& scheme) { return scheme.Decrypt(blob, ad, master_key); }, SchemeFor(blob));
}

EncryptedBlob Encryptor::ReEncrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& old_key,
                                   const SecretKey& new_key) const {
  return std::visit([&](const auto& scheme) { return scheme.ReEncrypt(blob, ad, old_key, new_key); }, SchemeFor(blob));
}

bool Encryptor::IsWrappedWith(const EncryptedBlob& blob, const SecretKey& key) {
  return FooterMatchesKey(blob.content_encryption_key, key);
}

std::string_view Encryptor::SchemeName() const {
  return std::visit([](const auto& scheme) { return scheme.Name(); }, scheme_);
}

} // namespace recsync::crypto
