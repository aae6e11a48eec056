#pragma once

#include <openssl/evp.h>

#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/crypto/secret_key.hpp"

namespace recsync::crypto {

/*
  Identity of a record that is authenticated but not encrypted. Changing any
  of these fields after encryption makes decryption fail.
*/
struct AdditionalData {
  std::string_view id;
  std::string_view version;
  std::string_view category;
  std::string_view host_id;
};

struct EncryptedBlob {
  // header + base64url(nonce || ciphertext || tag)
  std::string data;
  // JSON footer carrying the wrapped CEK and the id of the wrapping key.
  std::string content_encryption_key;

  bool operator==(const EncryptedBlob&) const = default;
};

struct Aes256Gcm {
  static constexpr std::string_view kName   = "aes-256-gcm";
  static constexpr std::string_view kHeader = "rs1.local.aes256gcm.";

  static const EVP_CIPHER* Cipher() {
    return EVP_aes_256_gcm();
  }
};

struct ChaCha20Poly1305 {
  static constexpr std::string_view kName   = "chacha20-poly1305";
  static constexpr std::string_view kHeader = "rs1.local.chacha20poly1305.";

  static const EVP_CIPHER* Cipher() {
    return EVP_chacha20_poly1305();
  }
};

inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kTagSize   = 16;

/*
  Envelope encryption with one AEAD.

  Each Encrypt draws a fresh CEK and nonce, seals the payload under the CEK
  with the record identity as associated data, and wraps the CEK under the
  master key. Every failure on the decrypt path is reported as
  util::AuthenticationFailure.
*/
template <typename Aead>
class EnvelopeScheme {
 public:
  static constexpr std::string_view Name() {
    return Aead::kName;
  }

  static bool Owns(std::string_view token) {
    return token.substr(0, Aead::kHeader.size()) == Aead::kHeader;
  }

  EncryptedBlob Encrypt(std::string_view plaintext, const AdditionalData& ad, const SecretKey& master_key) const;

  std::string Decrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& master_key) const;

  // Re-wraps the CEK under new_key after authenticating the blob with old_key.
  // The token is returned unchanged.
  EncryptedBlob ReEncrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& old_key, const SecretKey& new_key) const;
};

extern template class EnvelopeScheme<Aes256Gcm>;
extern template class EnvelopeScheme<ChaCha20Poly1305>;

// Shared by every scheme.
std::string EncodeFooter(const SecretKey& master_key, const SecretKey& cek);
SecretKey   UnwrapFooter(std::string_view footer_json, const SecretKey& master_key);
bool        FooterMatchesKey(std::string_view footer_json, const SecretKey& master_key);

std::string AssertionJson(const AdditionalData& ad);
std::string PreAuthEncode(std::initializer_list<std::string_view> pieces);

} // namespace recsync::crypto
