#pragma once

#include <core/common.h>

namespace d2anim {

//! Number of hash buckets in an animation table. Fixed by the format.
inline constexpr u32 kBucketCount = 256;

//! Bucket of an identifier: the sum of its uppercased ASCII code points,
//! modulo 256.
//!
//! The value is never stored in the file; a record's position implies it.
constexpr u8 HashIdentifier(std::string_view identifier) {
  u32 sum = 0;
  for (const char c : identifier) {
    u32 u = static_cast<u8>(c);
    if (u >= 'a' && u <= 'z') {
      u -= 'a' - 'A';
    }
    sum += u;
  }
  return static_cast<u8>(sum % kBucketCount);
}

static_assert(HashIdentifier("aaaaaaa") == HashIdentifier("AAAAAAA"));
static_assert(HashIdentifier("AAAAAAA") == (65 * 7) % 256);

} // namespace d2anim
