#pragma once

#include <cstdint>
#include <string_view>

namespace bsa {

// Legacy 64-bit name fingerprint stored in the archive's hash table.
// The name is ASCII case-folded before hashing; bytes >= 0x80 pass through.
// Writers hash the name together with its null terminator.
// The hash runs over the name's bytes, not its Unicode code points, so
// non-ASCII UTF-8 names hash each byte separately.
uint64_t nameHash(std::string_view name) noexcept;

} // namespace bsa
