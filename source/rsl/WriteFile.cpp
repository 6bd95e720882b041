#include "WriteFile.hpp"
#include <fstream>

namespace rsl {

Result<void> WriteFile(const std::span<const uint8_t> data,
                       const std::string_view path) {
  rsl::trace("Writing {} bytes to {}", data.size(), path);
  std::ofstream stream(std::string(path), std::ios::binary | std::ios::out);
  EXPECT(stream.is_open(), "Failed to open " + std::string(path));
  stream.write(reinterpret_cast<const char*>(data.data()), data.size());
  EXPECT(stream.good(), "Failed to write " + std::string(path));
  return {};
}

} // namespace rsl
