#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

#include "internal/util/hex.hpp"

namespace atomicswap::util {

std::string NewId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<std::uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    auto word = rng();
    for (std::size_t j = 0; j < 8; ++j, word >>= 8) {
      bytes[i + j] = static_cast<std::uint8_t>(word & 0xFF);
    }
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

  const std::string hex = ToHex(bytes.data(), bytes.size());
  return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' + hex.substr(16, 4) + '-' + hex.substr(20);
}

} // namespace atomicswap::util
