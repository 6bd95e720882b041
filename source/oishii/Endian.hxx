#pragma once

#include <bit>
#include <stdint.h>

static_assert(__cpp_lib_byteswap >= 202110L, "Depends on std::byteswap");

namespace oishii {

//! @brief Fast endian swapping.
//!
//! @tparam T Integral type of value to swap. Must be sized 1, 2, or 4
//!
//! @return T endian swapped.
template <typename T> inline T swapEndian(T v) {
  static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4,
                "T must of size 1, 2, or 4");
  if constexpr (sizeof(T) == 1) {
    return v;
  } else {
    return std::byteswap(v);
  }
}

enum class EndianSelect {
  Current, // Grab current endian
  // Explicitly use endian
  Big,
  Little
};

template <typename T, EndianSelect E = EndianSelect::Current>
inline T endianDecode(T val, std::endian fileEndian) {
  if constexpr (E == EndianSelect::Big) {
    return std::endian::native != std::endian::big ? swapEndian<T>(val) : val;
  } else if constexpr (E == EndianSelect::Little) {
    return std::endian::native != std::endian::little ? swapEndian<T>(val)
                                                      : val;
  } else if constexpr (E == EndianSelect::Current) {
    return std::endian::native != fileEndian ? swapEndian<T>(val) : val;
  }

  return val;
}

} // namespace oishii
