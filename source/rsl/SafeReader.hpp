#pragma once

#include <core/common.h>
#include <oishii/reader/binary_reader.hxx>
#include <rsl/Ranges.hpp>

namespace rsl {

//! Thin wrapper over a `BinaryReader` where every read is fallible.
class SafeReader {
public:
  template <typename T> using Result = std::expected<T, std::string>;

  SafeReader(oishii::BinaryReader& reader) : mReader(reader) {}

  // Doesn't ever fail
  auto tell() const -> u32;

  auto U32() -> Result<u32>;

  template <size_t size> auto U8Buffer() -> Result<std::array<u8, size>> {
    auto buf = TRY(mReader.tryReadBuffer<u8>(size));
    return buf | rsl::ToArray<size>();
  }
  template <size_t size> auto CharBuffer() -> Result<std::array<char, size>> {
    auto buf = TRY(mReader.tryReadBuffer<char>(size));
    return buf | rsl::ToArray<size>();
  }

private:
  oishii::BinaryReader& mReader;
};

} // namespace rsl
