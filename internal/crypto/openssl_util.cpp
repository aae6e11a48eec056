#include "internal/crypto/openssl_util.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace recsync::crypto {
namespace {

std::string LastOpenSslError() {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown error";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

} // namespace

CryptoError::CryptoError(const std::string& msg) : std::runtime_error(msg + ": " + LastOpenSslError()) {
}

CipherCtxPtr NewCipherCtx() {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw CryptoError("EVP_CIPHER_CTX_new failed");
  }
  return ctx;
}

std::string RandomBytes(std::size_t size) {
  std::string out(size, '\0');
  if (size > 0 && RAND_bytes(MutableBytes(out), static_cast<int>(size)) != 1) {
    throw CryptoError("RAND_bytes failed");
  }
  return out;
}

std::string Sha256(std::string_view bytes) {
  std::string digest(SHA256_DIGEST_LENGTH, '\0');
  unsigned int length = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), MutableBytes(digest), &length, EVP_sha256(), nullptr) != 1) {
    throw CryptoError("SHA-256 failed");
  }
  digest.resize(length);
  return digest;
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace recsync::crypto
