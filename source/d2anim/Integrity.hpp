#pragma once

#include <core/common.h>
#include <d2anim/Record.hpp>

namespace d2anim {

//! Every identifier that was already seen earlier in |records|, once per
//! repeat and in encounter order. Three copies of "A1HTH1H" yield it twice.
std::vector<std::string>
FindDuplicateIdentifiers(std::span<const AnimationRecord> records);

//! Ascending trigger frames that playback never reaches
//! (frame >= frames_per_direction).
std::vector<u32> FindOutOfRangeTriggers(const AnimationRecord& record);

enum class DiagnosticKind {
  DuplicateIdentifier,
  TriggerBeyondLastFrame,
};

struct Diagnostic {
  DiagnosticKind kind;
  std::string identifier;
  // TriggerBeyondLastFrame only
  u32 frame = 0;
  u32 frames_per_direction = 0;

  std::string message() const;
  bool operator==(const Diagnostic&) const = default;
};

//! Both checks over a whole list. Never fails and never logs; rendering is
//! left to the caller.
std::vector<Diagnostic> CheckRecords(std::span<const AnimationRecord> records);

//! What to do with triggers that lie beyond the last frame.
enum class TriggerPolicy {
  Lenient, //!< Diagnostic only
  Strict,  //!< Validation error
};

//! Under `Strict`, fail on the first record with an out-of-range trigger.
Result<void> EnforceTriggerPolicy(std::span<const AnimationRecord> records,
                                  TriggerPolicy policy);

} // namespace d2anim
