#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace recsync::crypto {

inline constexpr std::size_t kKeySize = 32;

/*
  Fixed-size symmetric key. Used both for the master key (KEK) and for
  per-record content keys (CEK). Wiped on destruction.
*/
class SecretKey {
 public:
  SecretKey() = default;
  explicit SecretKey(std::string_view bytes);

  SecretKey(const SecretKey&)            = default;
  SecretKey& operator=(const SecretKey&) = default;
  ~SecretKey();

  static SecretKey Generate();

  std::string_view View() const {
    return {reinterpret_cast<const char*>(bytes_.data()), bytes_.size()};
  }
  const uint8_t* data() const {
    return bytes_.data();
  }
  std::size_t size() const {
    return bytes_.size();
  }

  bool operator==(const SecretKey& other) const;

 private:
  std::array<uint8_t, kKeySize> bytes_{};
};

} // namespace recsync::crypto
