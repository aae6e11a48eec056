#include "uuid.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace recsync::util {
namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

void FillRandom(uint8_t* out, size_t size) {
  for (size_t i = 0; i < size; ++i) {
    out[i] = static_cast<uint8_t>(Rng()());
  }
}

} // namespace

UUID GenerateUUID() {
  UUID id{};
  FillRandom(id.data(), id.size());

  // RFC 9562 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

UUID GenerateUUIDv7() {
  const uint64_t millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();

  UUID id{};
  for (int i = 0; i < 6; ++i) {
    id[i] = static_cast<uint8_t>(millis >> (8 * (5 - i)));
  }
  FillRandom(id.data() + 6, id.size() - 6);

  id[6] = (id[6] & 0x0F) | 0x70;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  if (!IsUUID(str)) {
    throw std::invalid_argument("Invalid UUID string: " + str);
  }

  std::string hex;
  for (char c : str)
    if (c != '-') hex += c;

  UUID id{};
  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));

  return id;
}

bool IsUUID(const std::string& str) {
  if (str.size() != 36) {
    return false;
  }
  for (size_t i = 0; i < str.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-') return false;
    } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
      return false;
    }
  }
  return true;
}

std::string NewHostId() {
  return ToString(GenerateUUID());
}

std::string NewRecordId() {
  return ToString(GenerateUUIDv7());
}

} // namespace recsync::util
