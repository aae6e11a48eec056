#include "internal/crypto/envelope.hpp"

#include <google/protobuf/util/json_util.h>
#include <openssl/crypto.h>

#include <optional>

#include "internal/crypto/key_wrap.hpp"
#include "internal/crypto/openssl_util.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"
#include "recsync/record/v1/record.pb.h"

namespace recsync::crypto {
namespace {

std::optional<record::v1::WrappedKeyFooter> ParseFooter(std::string_view footer_json) {
  record::v1::WrappedKeyFooter             footer;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (!google::protobuf::util::JsonStringToMessage(std::string(footer_json), &footer, options).ok()) {
    return std::nullopt;
  }
  return footer;
}

void AppendLe64(std::string& out, uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    // Top bit cleared so the length is never read as negative.
    const uint8_t byte = static_cast<uint8_t>(value >> (8 * i));
    out.push_back(static_cast<char>(i == 7 ? byte & 0x7F : byte));
  }
}

std::string Seal(const EVP_CIPHER* cipher, const SecretKey& cek, std::string_view nonce, std::string_view aad, std::string_view plaintext) {
  auto ctx = NewCipherCtx();
  if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, cek.data(), Bytes(nonce)) != 1) {
    throw CryptoError("AEAD init failed");
  }

  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, Bytes(aad), static_cast<int>(aad.size())) != 1) {
    throw CryptoError("AEAD associated data failed");
  }

  std::string out(nonce);
  out.resize(nonce.size() + plaintext.size() + kTagSize);
  auto* cursor = MutableBytes(out) + nonce.size();

  if (EVP_EncryptUpdate(ctx.get(), cursor, &len, Bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
    throw CryptoError("AEAD encrypt failed");
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), cursor + len, &final_len) != 1) {
    throw CryptoError("AEAD finalize failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kTagSize), cursor + len + final_len) != 1) {
    throw CryptoError("AEAD tag failed");
  }
  out.resize(nonce.size() + static_cast<std::size_t>(len + final_len) + kTagSize);
  return out;
}

std::optional<std::string> Open(const EVP_CIPHER* cipher, const SecretKey& cek, std::string_view sealed, std::string_view aad) {
  if (sealed.size() < kNonceSize + kTagSize) {
    return std::nullopt;
  }
  const auto nonce      = sealed.substr(0, kNonceSize);
  const auto ciphertext = sealed.substr(kNonceSize, sealed.size() - kNonceSize - kTagSize);
  std::string tag(sealed.substr(sealed.size() - kTagSize));

  auto ctx = NewCipherCtx();
  if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, cek.data(), Bytes(nonce)) != 1) {
    return std::nullopt;
  }

  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, Bytes(aad), static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }

  std::string out(ciphertext.size() + EVP_MAX_BLOCK_LENGTH, '\0');
  if (EVP_DecryptUpdate(ctx.get(), MutableBytes(out), &len, Bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
    return std::nullopt;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
    return std::nullopt;
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), MutableBytes(out) + len, &final_len) != 1) {
    OPENSSL_cleanse(out.data(), out.size());
    return std::nullopt;
  }
  out.resize(static_cast<std::size_t>(len + final_len));
  return out;
}

} // namespace

std::string AssertionJson(const AdditionalData& ad) {
  record::v1::ImplicitAssertion assertion;
  assertion.set_id(std::string(ad.id));
  assertion.set_version(std::string(ad.version));
  assertion.set_category(std::string(ad.category));
  assertion.set_host_id(std::string(ad.host_id));

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(assertion, &json, options).ok()) {
    throw util::SerializationFailure("failed to encode implicit assertion");
  }
  return json;
}

std::string PreAuthEncode(std::initializer_list<std::string_view> pieces) {
  std::string out;
  AppendLe64(out, pieces.size());
  for (const auto piece : pieces) {
    AppendLe64(out, piece.size());
    out.append(piece);
  }
  return out;
}

std::string EncodeFooter(const SecretKey& master_key, const SecretKey& cek) {
  record::v1::WrappedKeyFooter footer;
  footer.set_wrapped_key(util::Base64UrlEncode(WrapKey(master_key, cek)));
  footer.set_key_id(KeyId(master_key));

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(footer, &json, options).ok()) {
    throw util::SerializationFailure("failed to encode key footer");
  }
  return json;
}

bool FooterMatchesKey(std::string_view footer_json, const SecretKey& master_key) {
  const auto footer = ParseFooter(footer_json);
  return footer && ConstantTimeEquals(footer->key_id(), KeyId(master_key));
}

SecretKey UnwrapFooter(std::string_view footer_json, const SecretKey& master_key) {
  const auto footer = ParseFooter(footer_json);
  if (!footer) {
    throw util::AuthenticationFailure();
  }
  // Key id check first so a wrong master key fails without touching the unwrap.
  if (!ConstantTimeEquals(footer->key_id(), KeyId(master_key))) {
    throw util::AuthenticationFailure();
  }
  const auto wrapped = util::Base64UrlDecode(footer->wrapped_key());
  if (!wrapped) {
    throw util::AuthenticationFailure();
  }
  auto cek = UnwrapKey(master_key, *wrapped);
  if (!cek) {
    throw util::AuthenticationFailure();
  }
  return *cek;
}

template <typename Aead>
EncryptedBlob EnvelopeScheme<Aead>::Encrypt(std::string_view plaintext, const AdditionalData& ad, const SecretKey& master_key) const {
  const SecretKey   cek   = SecretKey::Generate();
  const std::string nonce = RandomBytes(kNonceSize);
  const std::string aad   = PreAuthEncode({Aead::kHeader, AssertionJson(ad)});

  std::string encoded = util::Base64UrlEncode(plaintext);
  std::string sealed  = Seal(Aead::Cipher(), cek, nonce, aad, encoded);
  OPENSSL_cleanse(encoded.data(), encoded.size());

  EncryptedBlob blob;
  blob.data = std::string(Aead::kHeader) + util::Base64UrlEncode(sealed);
  blob.content_encryption_key = EncodeFooter(master_key, cek);
  return blob;
}

template <typename Aead>
std::string EnvelopeScheme<Aead>::Decrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& master_key) const {
  const SecretKey cek = UnwrapFooter(blob.content_encryption_key, master_key);

  if (!Owns(blob.data)) {
    throw util::AuthenticationFailure();
  }
  const auto sealed = util::Base64UrlDecode(std::string_view(blob.data).substr(Aead::kHeader.size()));
  if (!sealed) {
    throw util::AuthenticationFailure();
  }

  const std::string aad     = PreAuthEncode({Aead::kHeader, AssertionJson(ad)});
  auto              encoded = Open(Aead::Cipher(), cek, *sealed, aad);
  if (!encoded) {
    throw util::AuthenticationFailure();
  }

  auto plaintext = util::Base64UrlDecode(*encoded);
  OPENSSL_cleanse(encoded->data(), encoded->size());
  if (!plaintext) {
    throw util::AuthenticationFailure();
  }
  return std::move(*plaintext);
}

template <typename Aead>
EncryptedBlob EnvelopeScheme<Aead>::ReEncrypt(const EncryptedBlob& blob, const AdditionalData& ad, const SecretKey& old_key,
                                              const SecretKey& new_key) const {
  std::string plaintext = Decrypt(blob, ad, old_key);
  OPENSSL_cleanse(plaintext.data(), plaintext.size());

  const SecretKey cek = UnwrapFooter(blob.content_encryption_key, old_key);

  EncryptedBlob out;
  out.data                   = blob.data;
  out.content_encryption_key = EncodeFooter(new_key, cek);
  return out;
}

template class EnvelopeScheme<Aes256Gcm>;
template class EnvelopeScheme<ChaCha20Poly1305>;

} // namespace recsync::crypto
