#pragma once

#include <core/common.h>
#include <d2anim/Error.hpp>

namespace d2anim {

//! Frames addressable by a trigger; also the length of a record's code array.
inline constexpr u32 kFrameMax = 144;
inline constexpr u8 kTriggerCodeMin = 1;
inline constexpr u8 kTriggerCodeMax = 3;

//! Dense per-frame code array as stored in a record. 0 = no trigger.
using FrameCodes = std::array<u8, kFrameMax>;

//! A frame-synchronized event cue: `code` fires when playback reaches
//! `frame`.
class Trigger {
public:
  //! Fails with `FrameOutOfRange` or `CodeOutOfRange`.
  static Result<Trigger> Create(s64 frame, s64 code);

  u32 frame() const { return mFrame; }
  u8 code() const { return mCode; }

  bool operator==(const Trigger&) const = default;

private:
  Trigger(u8 frame, u8 code) : mFrame(frame), mCode(code) {}

  u8 mFrame;
  u8 mCode;
};

//! A non-zero cell of a `FrameCodes` array, before validation.
struct RawTrigger {
  u32 frame;
  u8 code;

  bool operator==(const RawTrigger&) const = default;
};

//! At most one trigger per frame, iterated in ascending frame order.
class TriggerSet {
public:
  TriggerSet() = default;

  //! Sorts |triggers| by frame. Fails with `DuplicateTriggerFrame` when two
  //! share a frame, whatever their codes.
  static Result<TriggerSet> Create(std::vector<Trigger> triggers);
  //! Validates every non-zero code of |codes|.
  static Result<TriggerSet> FromFrameCodes(const FrameCodes& codes);

  auto begin() const { return mTriggers.begin(); }
  auto end() const { return mTriggers.end(); }
  std::size_t size() const { return mTriggers.size(); }
  bool empty() const { return mTriggers.empty(); }

  //! Code at |frame|, if a trigger occupies it
  std::optional<u8> codeAt(u32 frame) const;

  bool operator==(const TriggerSet&) const = default;

private:
  explicit TriggerSet(std::vector<Trigger>&& sorted)
      : mTriggers(std::move(sorted)) {}

  std::vector<Trigger> mTriggers;
};

FrameCodes EncodeFrames(const TriggerSet& triggers);
//! Never fails: every non-zero byte is reported, in frame order.
std::vector<RawTrigger> DecodeFrames(const FrameCodes& codes);

} // namespace d2anim
