#include "SafeReader.hpp"

namespace rsl {

auto SafeReader::tell() const -> u32 { return mReader.tell(); }

auto SafeReader::U32() -> Result<u32> { return mReader.tryRead<u32>(); }

} // namespace rsl
