#include "AnimDataIO.hpp"

#include <limits>
#include <oishii/reader/binary_reader.hxx>
#include <oishii/writer/binary_writer.hxx>

namespace d2anim {

Result<std::vector<AnimationRecord>> ReadAnimData(std::span<const u8> data,
                                                  std::string_view path) {
  if (data.size() > std::numeric_limits<u32>::max()) {
    return std::unexpected(Error{
        .kind = ErrorKind::Format,
        .code = ErrorCode::SizeMismatch,
        .message = fmt::format("{} is too large ({} bytes)", path, data.size()),
    });
  }

  oishii::BinaryReader reader(data, path, std::endian::little);
  rsl::SafeReader safe(reader);

  std::vector<AnimationRecord> records;
  for (u32 bucket = 0; bucket < kBucketCount; ++bucket) {
    const u32 count_offset = safe.tell();
    const u32 count = TRY(StreamResult(
        safe.U32(), count_offset,
        fmt::format("Cannot unpack record count for bucket {}", bucket)));

    for (u32 i = 0; i < count; ++i) {
      const u32 record_offset = safe.tell();
      auto record = TRY(ReadRecord(safe));
      const u8 hash = HashIdentifier(record.identifier());
      if (hash != bucket) {
        return std::unexpected(Error{
            .kind = ErrorKind::Data,
            .code = ErrorCode::BucketMismatch,
            .message = fmt::format(
                "Incorrect hash (identifier=\"{}\"): expected {} but got {}",
                record.identifier(), bucket, hash),
            .offset = record_offset,
            .field = "identifier",
        });
      }
      records.push_back(std::move(record));
    }
  }

  if (safe.tell() != data.size()) {
    return std::unexpected(Error{
        .kind = ErrorKind::Format,
        .code = ErrorCode::SizeMismatch,
        .message = fmt::format(
            "Data size mismatch: buckets use {} bytes, but {} is {} bytes",
            safe.tell(), path, data.size()),
        .offset = safe.tell(),
    });
  }

  return records;
}

std::vector<u8> WriteAnimData(std::span<const AnimationRecord> records) {
  std::array<std::vector<const AnimationRecord*>, kBucketCount> buckets;
  for (const auto& record : records) {
    buckets[HashIdentifier(record.identifier())].push_back(&record);
  }

  oishii::Writer writer(
      static_cast<u32>(ComputeAnimDataSize(records.size())),
      std::endian::little);
  for (const auto& bucket : buckets) {
    writer.write<u32>(static_cast<u32>(bucket.size()));
    for (const auto* record : bucket) {
      WriteRecord(writer, *record);
    }
  }
  return writer.takeBuf();
}

} // namespace d2anim
