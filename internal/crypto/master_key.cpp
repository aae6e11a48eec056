#include "internal/crypto/master_key.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <openssl/crypto.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace recsync::crypto {
namespace {

std::string Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(begin, end - begin + 1));
}

} // namespace

std::string EncodeKey(const SecretKey& key) {
  return util::Base64Encode(key.View());
}

SecretKey DecodeKey(std::string_view text) {
  auto decoded = util::Base64Decode(Trim(text));
  if (!decoded || decoded->size() != kKeySize) {
    throw util::SerializationFailure("master key must be base64 of " + std::to_string(kKeySize) + " bytes");
  }
  SecretKey key(*decoded);
  OPENSSL_cleanse(decoded->data(), decoded->size());
  return key;
}

SecretKey LoadKey(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("master key file not found: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  std::string text = buffer.str();
  SecretKey   key  = DecodeKey(text);
  OPENSSL_cleanse(text.data(), text.size());
  return key;
}

void WriteKeyFile(const std::string& path, const SecretKey& key) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::StoreIoFailure("cannot create key directory " + parent.string() + ": " + ec.message());
    }
  }

  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
  if (fd < 0) {
    if (errno == EEXIST) {
      throw util::AlreadyExists("master key file already exists: " + path);
    }
    throw util::StoreIoFailure("cannot create key file " + path + ": " + std::strerror(errno));
  }

  std::string line = EncodeKey(key) + "\n";
  std::size_t offset = 0;
  while (offset < line.size()) {
    const ssize_t n = ::write(fd, line.data() + offset, line.size() - offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd);
      OPENSSL_cleanse(line.data(), line.size());
      throw util::StoreIoFailure("cannot write key file " + path + ": " + std::strerror(err));
    }
    offset += static_cast<std::size_t>(n);
  }
  OPENSSL_cleanse(line.data(), line.size());

  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    throw util::StoreIoFailure("cannot flush key file " + path + ": " + std::strerror(errno));
  }
}

SecretKey LoadOrCreateKey(const std::string& path) {
  if (std::filesystem::exists(path)) {
    return LoadKey(path);
  }

  SecretKey key = SecretKey::Generate();
  try {
    WriteKeyFile(path, key);
  } catch (const util::AlreadyExists&) {
    // Another process created it first.
    return LoadKey(path);
  }
  RECSYNC_LOG_INFO("generated master key", {observability::StringField("path", path)});
  return key;
}

} // namespace recsync::crypto
