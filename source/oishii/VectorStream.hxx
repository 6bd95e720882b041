#pragma once

#include "AbstractStream.hxx"
#include <vector>

namespace oishii {

class VectorStream : public AbstractStream {
public:
  VectorStream() = default;
  VectorStream(uint32_t buffer_size) : mBuf(buffer_size) {}
  VectorStream(std::vector<uint8_t> buf) : mBuf(std::move(buf)) {}

  void seekSet(uint32_t pos) override { mPos = pos; }
  uint32_t tell() const override { return mPos; }
  uint32_t endpos() const override {
    return static_cast<uint32_t>(mBuf.size());
  }

  const uint8_t* getStreamStart() const { return mBuf.data(); }
  std::vector<uint8_t>&& takeBuf() { return std::move(mBuf); }

protected:
  std::vector<uint8_t> mBuf;
  uint32_t mPos = 0;
};

} // namespace oishii
