#pragma once

#include <core/common.h>
#include <d2anim/Error.hpp>
#include <d2anim/Trigger.hpp>

namespace d2anim {

//! Metadata of one animation (one COF).
//!
//! Only obtainable through `Create`, so every instance satisfies all field
//! invariants. There are no setters: derive a changed record by creating a
//! new one.
class AnimationRecord {
public:
  static constexpr std::size_t kIdentifierLength = 7;

  //! Fails with a `Validation` error whose `field` names the offending
  //! member.
  static Result<AnimationRecord> Create(std::string_view identifier,
                                        s64 frames_per_direction, s64 speed,
                                        TriggerSet triggers);

  //! Exactly 7 ASCII characters, none of them null.
  static Result<void> ValidateIdentifier(std::string_view identifier);

  const std::string& identifier() const { return mIdentifier; }
  u32 framesPerDirection() const { return mFramesPerDirection; }
  u32 speed() const { return mSpeed; }
  const TriggerSet& triggers() const { return mTriggers; }

  bool operator==(const AnimationRecord&) const = default;

private:
  AnimationRecord() = default;

  std::string mIdentifier;
  u32 mFramesPerDirection = 0;
  u32 mSpeed = 0;
  TriggerSet mTriggers;
};

//! Stable sort by identifier.
void SortRecordsByIdentifier(std::vector<AnimationRecord>& records);

} // namespace d2anim
