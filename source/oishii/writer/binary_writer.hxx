#pragma once

#include <algorithm>
#include <bit>
#include <string>
#include <vector>

#include "../Endian.hxx"
#include "../VectorStream.hxx"
#include <core/common.h>

namespace oishii {

//! @brief Writer with expanding buffer.
//!
class Writer final : public VectorStream {
public:
  Writer(uint32_t buffer_size, std::endian endian);

  template <typename T, EndianSelect E = EndianSelect::Current>
  void write(T val) {
    static_assert(std::is_integral_v<T>);
    if (tell() + sizeof(T) > mBuf.size())
      mBuf.resize(tell() + sizeof(T));

    const T decoded = endianDecode<T, E>(val, m_endian);
    const auto raw = std::bit_cast<std::array<u8, sizeof(T)>>(decoded);
    std::copy(raw.begin(), raw.end(), mBuf.begin() + tell());

    seek<Whence::Current>(sizeof(T));
  }

  //! Copy |buf| verbatim at the cursor
  void writeBuffer(std::span<const u8> buf) {
    if (tell() + buf.size() > mBuf.size())
      mBuf.resize(tell() + buf.size());
    std::copy(buf.begin(), buf.end(), mBuf.begin() + tell());
    seek<Whence::Current>(static_cast<int>(buf.size()));
  }

private:
  std::endian m_endian = std::endian::big; // to swap
};

} // namespace oishii
