#include "uuid.hpp"

#include <array>

namespace resolver::util {

std::string SeededUuidGenerator::Next() {
  std::array<std::uint8_t, 16> bytes{};
  const std::uint64_t          halves[2] = {engine_(), engine_()};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<std::uint8_t>(halves[i / 8] >> ((i % 8) * 8));
  }
  bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
  bytes[8] = (bytes[8] & 0x3F) | 0x80; // RFC 4122 variant

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

} // namespace resolver::util
