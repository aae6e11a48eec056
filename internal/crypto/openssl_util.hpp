#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace recsync::crypto {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// Raised when OpenSSL itself fails on the encrypt path (allocation, RNG).
class CryptoError : public std::runtime_error {
 public:
  explicit CryptoError(const std::string& msg);
};

CipherCtxPtr NewCipherCtx();

std::string RandomBytes(std::size_t size);
std::string Sha256(std::string_view bytes);

// Constant-time for inputs of equal length.
bool ConstantTimeEquals(std::string_view a, std::string_view b);

inline const unsigned char* Bytes(std::string_view view) {
  return reinterpret_cast<const unsigned char*>(view.data());
}

inline unsigned char* MutableBytes(std::string& buffer) {
  return reinterpret_cast<unsigned char*>(buffer.data());
}

} // namespace recsync::crypto
