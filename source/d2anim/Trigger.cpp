#include "Trigger.hpp"

#include <algorithm>

namespace d2anim {

Result<Trigger> Trigger::Create(s64 frame, s64 code) {
  if (frame < 0 || frame >= kFrameMax) {
    return std::unexpected(Error{
        .kind = ErrorKind::Validation,
        .code = ErrorCode::FrameOutOfRange,
        .message = fmt::format("frame must be between 0 and {} (got {})",
                               kFrameMax - 1, frame),
        .field = "triggers",
    });
  }
  if (code < kTriggerCodeMin || code > kTriggerCodeMax) {
    return std::unexpected(Error{
        .kind = ErrorKind::Validation,
        .code = ErrorCode::CodeOutOfRange,
        .message = fmt::format("code must be between {} and {} (got {} at "
                               "frame {})",
                               kTriggerCodeMin, kTriggerCodeMax, code, frame),
        .field = "triggers",
    });
  }
  return Trigger(static_cast<u8>(frame), static_cast<u8>(code));
}

Result<TriggerSet> TriggerSet::Create(std::vector<Trigger> triggers) {
  std::stable_sort(triggers.begin(), triggers.end(),
                   [](const Trigger& l, const Trigger& r) {
                     return l.frame() < r.frame();
                   });
  auto dupe = std::adjacent_find(triggers.begin(), triggers.end(),
                                 [](const Trigger& l, const Trigger& r) {
                                   return l.frame() == r.frame();
                                 });
  if (dupe != triggers.end()) {
    return std::unexpected(Error{
        .kind = ErrorKind::Validation,
        .code = ErrorCode::DuplicateTriggerFrame,
        .message = fmt::format("Frame {} has more than one trigger (codes {} "
                               "and {})",
                               dupe->frame(), dupe->code(),
                               std::next(dupe)->code()),
        .field = "triggers",
    });
  }
  return TriggerSet(std::move(triggers));
}

Result<TriggerSet> TriggerSet::FromFrameCodes(const FrameCodes& codes) {
  std::vector<Trigger> triggers;
  for (const auto& raw : DecodeFrames(codes)) {
    triggers.push_back(TRY(Trigger::Create(raw.frame, raw.code)));
  }
  return Create(std::move(triggers));
}

std::optional<u8> TriggerSet::codeAt(u32 frame) const {
  auto it = std::lower_bound(
      mTriggers.begin(), mTriggers.end(), frame,
      [](const Trigger& t, u32 f) { return t.frame() < f; });
  if (it == mTriggers.end() || it->frame() != frame) {
    return std::nullopt;
  }
  return it->code();
}

FrameCodes EncodeFrames(const TriggerSet& triggers) {
  FrameCodes codes{};
  for (const auto& t : triggers) {
    codes[t.frame()] = t.code();
  }
  return codes;
}

std::vector<RawTrigger> DecodeFrames(const FrameCodes& codes) {
  std::vector<RawTrigger> raw;
  for (u32 frame = 0; frame < codes.size(); ++frame) {
    if (codes[frame] != 0) {
      raw.push_back({.frame = frame, .code = codes[frame]});
    }
  }
  return raw;
}

} // namespace d2anim
