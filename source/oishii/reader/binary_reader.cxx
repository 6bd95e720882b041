#include "binary_reader.hxx"

namespace oishii {

BinaryReader::BinaryReader(std::span<const u8> view, std::string_view path,
                           std::endian endian)
    : VectorStream(std::vector<u8>{view.begin(), view.end()}), m_path(path),
      mFileEndian(endian) {}
BinaryReader::~BinaryReader() = default;

template <typename T, EndianSelect E = EndianSelect::Current,
          bool unaligned = false>
std::expected<T, std::string> tryReadImpl(oishii::BinaryReader& reader) {
  auto result = reader.tryGetAt<T, E, unaligned>(reader.tell());
  if (result.has_value()) {
    // Only advance stream on success
    reader.seekSet(reader.tell() + sizeof(T));
  }
  return result;
}

// Fields of an animation table are aligned dwords; bytes go through
// tryReadBuffer.
template <>
auto BinaryReader::tryRead<u32, EndianSelect::Current, false>() -> Result<u32> {
  return tryReadImpl<u32, EndianSelect::Current, false>(*this);
}

} // namespace oishii
