#include "internal/crypto/key_wrap.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "internal/crypto/openssl_util.hpp"
#include "internal/util/base64.hpp"

namespace recsync::crypto {
namespace {

constexpr std::string_view kKeyIdPrefix = "rs1.kid.";
constexpr std::size_t      kKeyIdBytes  = 24;

CipherCtxPtr WrapContext(const SecretKey& kek, bool encrypt) {
  auto ctx = NewCipherCtx();
  EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, kek.data(), nullptr, encrypt ? 1 : 0) != 1) {
    throw CryptoError("key wrap init failed");
  }
  return ctx;
}

} // namespace

std::string WrapKey(const SecretKey& kek, const SecretKey& cek) {
  auto ctx = WrapContext(kek, true);

  std::string out(kWrappedKeySize + EVP_MAX_BLOCK_LENGTH, '\0');
  int         written = 0;
  if (EVP_EncryptUpdate(ctx.get(), MutableBytes(out), &written, cek.data(), static_cast<int>(cek.size())) != 1) {
    throw CryptoError("key wrap failed");
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), MutableBytes(out) + written, &final_len) != 1) {
    throw CryptoError("key wrap finalize failed");
  }
  out.resize(static_cast<std::size_t>(written + final_len));
  return out;
}

std::optional<SecretKey> UnwrapKey(const SecretKey& kek, std::string_view wrapped) {
  if (wrapped.size() != kWrappedKeySize) {
    return std::nullopt;
  }

  auto ctx = WrapContext(kek, false);

  std::string out(kWrappedKeySize + EVP_MAX_BLOCK_LENGTH, '\0');
  int         written = 0;
  if (EVP_DecryptUpdate(ctx.get(), MutableBytes(out), &written, Bytes(wrapped), static_cast<int>(wrapped.size())) != 1 || written <= 0) {
    OPENSSL_cleanse(out.data(), out.size());
    return std::nullopt;
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), MutableBytes(out) + written, &final_len) != 1 ||
      static_cast<std::size_t>(written + final_len) != kKeySize) {
    OPENSSL_cleanse(out.data(), out.size());
    return std::nullopt;
  }

  SecretKey cek(std::string_view(out.data(), kKeySize));
  OPENSSL_cleanse(out.data(), out.size());
  return cek;
}

std::string KeyId(const SecretKey& kek) {
  std::string material(kKeyIdPrefix);
  material.append(kek.View());
  const std::string digest = Sha256(material);
  OPENSSL_cleanse(material.data(), material.size());
  return std::string(kKeyIdPrefix) + util::Base64UrlEncode(std::string_view(digest).substr(0, kKeyIdBytes));
}

} // namespace recsync::crypto
