#include "Record.hpp"

#include <algorithm>
#include <limits>

namespace d2anim {

static Result<u32> CheckDword(s64 value, std::string_view field) {
  constexpr s64 kMax = std::numeric_limits<u32>::max();
  if (value < 0 || value > kMax) {
    return std::unexpected(Error{
        .kind = ErrorKind::Validation,
        .code = ErrorCode::ValueOutOfRange,
        .message = fmt::format("{} must be between 0 and {} (got {})", field,
                               kMax, value),
        .field = std::string(field),
    });
  }
  return static_cast<u32>(value);
}

Result<void> AnimationRecord::ValidateIdentifier(std::string_view identifier) {
  const auto fail = [&](ErrorCode code, std::string message) {
    return std::unexpected(Error{
        .kind = ErrorKind::Validation,
        .code = code,
        .message = std::move(message),
        .field = "identifier",
    });
  };
  if (identifier.size() != kIdentifierLength) {
    return fail(ErrorCode::IdentifierLength,
                fmt::format("Identifier must have exactly {} characters "
                            "(\"{}\" has {})",
                            kIdentifierLength, identifier, identifier.size()));
  }
  if (identifier.find('\0') != std::string_view::npos) {
    return fail(ErrorCode::IdentifierContainsNull,
                "Identifier must not contain a null character");
  }
  if (std::any_of(identifier.begin(), identifier.end(),
                  [](char c) { return static_cast<u8>(c) >= 0x80; })) {
    return fail(ErrorCode::IdentifierNotAscii,
                "Identifier must only contain ASCII characters");
  }
  return {};
}

Result<AnimationRecord>
AnimationRecord::Create(std::string_view identifier, s64 frames_per_direction,
                        s64 speed, TriggerSet triggers) {
  TRY(ValidateIdentifier(identifier));

  AnimationRecord record;
  record.mIdentifier = std::string(identifier);
  record.mFramesPerDirection =
      TRY(CheckDword(frames_per_direction, "frames_per_direction"));
  record.mSpeed = TRY(CheckDword(speed, "speed"));
  record.mTriggers = std::move(triggers);
  return record;
}

void SortRecordsByIdentifier(std::vector<AnimationRecord>& records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const AnimationRecord& l, const AnimationRecord& r) {
                     return l.identifier() < r.identifier();
                   });
}

} // namespace d2anim
