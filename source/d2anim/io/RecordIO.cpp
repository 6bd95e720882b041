#include "RecordIO.hpp"

#include <algorithm>

namespace d2anim {

// Decoded values failing record invariants are corrupt data, not caller
// mistakes.
static Error AsDataError(Error err, u32 offset) {
  err.kind = ErrorKind::Data;
  err.message = "Invalid record field: " + err.message;
  err.offset = offset;
  return err;
}

Result<AnimationRecord> ReadRecord(rsl::SafeReader& reader) {
  const u32 start = reader.tell();

  const auto name = TRY(StreamResult(
      reader.CharBuffer<bin::kIdentifierFieldSize>(), start,
      "Cannot unpack record identifier"));
  const u32 frames_per_direction = TRY(StreamResult(
      reader.U32(), start, "Cannot unpack record frames_per_direction"));
  const u32 speed =
      TRY(StreamResult(reader.U32(), start, "Cannot unpack record speed"));
  const FrameCodes codes = TRY(StreamResult(reader.U8Buffer<kFrameMax>(), start,
                                            "Cannot unpack record frame codes"));

  // Only the part before the first null is significant
  const auto terminator = std::find(name.begin(), name.end(), '\0');
  const std::string_view identifier(name.data(), terminator - name.begin());
  if (std::any_of(identifier.begin(), identifier.end(),
                  [](char c) { return static_cast<u8>(c) >= 0x80; })) {
    return std::unexpected(Error{
        .kind = ErrorKind::Data,
        .code = ErrorCode::IdentifierNotAscii,
        .message = "Record identifier is not valid ASCII",
        .offset = start,
        .field = "identifier",
    });
  }

  auto triggers = TriggerSet::FromFrameCodes(codes);
  if (!triggers) {
    return std::unexpected(AsDataError(triggers.error(), start));
  }
  auto record = AnimationRecord::Create(identifier, frames_per_direction,
                                        speed, std::move(*triggers));
  if (!record) {
    return std::unexpected(AsDataError(record.error(), start));
  }
  return std::move(*record);
}

void WriteRecord(oishii::Writer& writer, const AnimationRecord& record) {
  std::array<u8, bin::kIdentifierFieldSize> name{};
  std::copy(record.identifier().begin(), record.identifier().end(),
            name.begin());
  writer.writeBuffer(name);
  writer.write<u32>(record.framesPerDirection());
  writer.write<u32>(record.speed());
  writer.writeBuffer(EncodeFrames(record.triggers()));
}

} // namespace d2anim
