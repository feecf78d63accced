#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace bsa {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return ((value & 0x00000000000000FFull) << 56) | ((value & 0x000000000000FF00ull) << 40) |
         ((value & 0x0000000000FF0000ull) << 24) | ((value & 0x00000000FF000000ull) << 8) |
         ((value & 0x000000FF00000000ull) >> 8) | ((value & 0x0000FF0000000000ull) >> 24) |
         ((value & 0x00FF000000000000ull) >> 40) | ((value & 0xFF00000000000000ull) >> 56);
}

} // namespace detail

inline constexpr bool is_big_endian() noexcept {
  return std::endian::native == std::endian::big;
}

// Archive integers are stored little-endian
inline constexpr uint32_t fromLe32(uint32_t value) noexcept {
  if constexpr (is_big_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t toLe32(uint32_t value) noexcept {
  if constexpr (is_big_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint64_t toLe64(uint64_t value) noexcept {
  if constexpr (is_big_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Unaligned load/store of little-endian words
inline uint32_t loadLe32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, 4);
  return fromLe32(value);
}

inline void storeLe32(uint8_t *dst, uint32_t value) noexcept {
  value = toLe32(value);
  std::memcpy(dst, &value, 4);
}

inline void storeLe64(uint8_t *dst, uint64_t value) noexcept {
  value = toLe64(value);
  std::memcpy(dst, &value, 8);
}

} // namespace bsa
