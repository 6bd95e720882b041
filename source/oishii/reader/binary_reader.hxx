#pragma once

#include "../Endian.hxx"
#include "../VectorStream.hxx"

#include <algorithm>
#include <core/common.h>
#include <fmt/format.h>

namespace oishii {

class BinaryReader final : public VectorStream {
public:
  //! Failure type is always `std::string`
  template <typename T> using Result = std::expected<T, std::string>;

  //! Read file from memory
  BinaryReader(std::span<const u8> view, std::string_view path,
               std::endian endian);
  BinaryReader(const BinaryReader&) = delete;
  ~BinaryReader();

  //! Pop a value from the stream (of type |T|)
  template <typename T,                             //
            EndianSelect E = EndianSelect::Current, //
            bool unaligned = false>
  Result<T> tryRead();

  //! Get a value from an arbitrary point in the file
  template <typename T,                             //
            EndianSelect E = EndianSelect::Current, //
            bool unaligned = false>
  auto tryGetAt(u32 trans) -> Result<T> {
    if (!unaligned && (trans % sizeof(T))) {
      return std::unexpected(fmt::format(
          "Alignment error: {} is not {}-byte aligned.", trans, sizeof(T)));
    }

    if (static_cast<u64>(trans) + sizeof(T) > endpos()) {
      return std::unexpected(fmt::format(
          "Bounds error in {}: Reading {} bytes from {} exceeds buffer size "
          "of {}",
          m_path, sizeof(T), trans, endpos()));
    }

    T raw;
    std::copy_n(getStreamStart() + trans, sizeof(T),
                reinterpret_cast<u8*>(&raw));
    return endianDecode<T, E>(raw, mFileEndian);
  }

  template <typename T>
  auto tryReadBuffer(u32 size, u32 addr) -> Result<std::vector<T>> {
    static_assert(sizeof(T) == 1);
    if (static_cast<u64>(addr) + size > endpos()) {
      return std::unexpected(fmt::format(
          "Buffer read exceeds length of {}: {} bytes from {} in a {} byte "
          "file",
          m_path, size, addr, endpos()));
    }
    std::vector<T> out(size);
    std::copy_n(mBuf.begin() + addr, size,
                reinterpret_cast<u8*>(out.data()));
    return out;
  }
  template <typename T> auto tryReadBuffer(u32 size) -> Result<std::vector<T>> {
    auto buf = tryReadBuffer<T>(size, tell());
    if (!buf) {
      return std::unexpected(buf.error());
    }
    seekSet(tell() + size);
    return *buf;
  }

private:
  std::string m_path = "Unknown Path";
  std::endian mFileEndian = std::endian::big;
};

template <>
auto BinaryReader::tryRead<u32, EndianSelect::Current, false>() -> Result<u32>;

} // namespace oishii
