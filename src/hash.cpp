#include <bsa/hash.hpp>

namespace bsa {

namespace {

inline uint32_t foldAscii(char c) noexcept {
  auto code = static_cast<uint32_t>(static_cast<unsigned char>(c));
  if (code >= 'A' && code <= 'Z') {
    code += 'a' - 'A';
  }
  return code;
}

} // namespace

uint64_t nameHash(std::string_view name) noexcept {
  const size_t half = name.size() >> 1;

  // Low word: first half of the name
  uint32_t low = 0;
  uint32_t shift = 0;
  for (size_t i = 0; i < half; ++i) {
    low ^= foldAscii(name[i]) << (shift & 0x1F);
    shift += 8;
  }

  // High word: whole name, rotated after each character
  uint64_t sum = 0;
  shift = 0;
  for (char c : name) {
    uint32_t temp = foldAscii(c) << (shift & 0x1F);
    sum ^= temp;
    uint32_t n = temp & 0x1F;
    sum = (sum << (32 - n)) | (sum >> n);
    shift += 8;
  }

  return static_cast<uint64_t>(low) | (sum << 32);
}

} // namespace bsa
