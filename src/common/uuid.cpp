#include "convlog/common/uuid.hpp"

#include <array>
#include <cctype>
#include <openssl/rand.h>
#include <random>

namespace convlog::common {

namespace {

void fill_random(std::array<unsigned char, 16> &bytes) {
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) == 1) {
    return;
  }
  // RAND_bytes only fails when the OpenSSL pool cannot be seeded.
  static thread_local std::mt19937_64 rng(std::random_device{}());
  for (auto &byte : bytes) {
    byte = static_cast<unsigned char>(rng() & 0xFFULL);
  }
}

} // namespace

std::string generate_uuid() {
  std::array<unsigned char, 16> bytes{};
  fill_random(bytes);
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back("0123456789abcdef"[bytes[i] >> 4U]);
    out.push_back("0123456789abcdef"[bytes[i] & 0x0FU]);
  }
  return out;
}

bool is_uuid(const std::string &value) {
  if (value.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (ch != '-') {
        return false;
      }
    } else if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace convlog::common
