#include "Integrity.hpp"

#include <set>

namespace d2anim {

std::vector<std::string>
FindDuplicateIdentifiers(std::span<const AnimationRecord> records) {
  std::vector<std::string> duplicates;
  std::set<std::string_view> seen;
  for (const auto& record : records) {
    if (!seen.insert(record.identifier()).second) {
      duplicates.push_back(record.identifier());
    }
  }
  return duplicates;
}

std::vector<u32> FindOutOfRangeTriggers(const AnimationRecord& record) {
  std::vector<u32> frames;
  for (const auto& trigger : record.triggers()) {
    if (trigger.frame() >= record.framesPerDirection()) {
      frames.push_back(trigger.frame());
    }
  }
  return frames;
}

std::string Diagnostic::message() const {
  switch (kind) {
  case DiagnosticKind::DuplicateIdentifier:
    return fmt::format("Duplicate entry found: {}", identifier);
  case DiagnosticKind::TriggerBeyondLastFrame:
    return fmt::format("Record {}: trigger frame {} may have no effect because "
                       "it is same or greater than frames_per_direction ({})",
                       identifier, frame, frames_per_direction);
  }
  return identifier;
}

std::vector<Diagnostic> CheckRecords(std::span<const AnimationRecord> records) {
  std::vector<Diagnostic> diagnostics;
  for (auto& identifier : FindDuplicateIdentifiers(records)) {
    diagnostics.push_back({
        .kind = DiagnosticKind::DuplicateIdentifier,
        .identifier = std::move(identifier),
    });
  }
  for (const auto& record : records) {
    for (const u32 frame : FindOutOfRangeTriggers(record)) {
      diagnostics.push_back({
          .kind = DiagnosticKind::TriggerBeyondLastFrame,
          .identifier = record.identifier(),
          .frame = frame,
          .frames_per_direction = record.framesPerDirection(),
      });
    }
  }
  return diagnostics;
}

Result<void> EnforceTriggerPolicy(std::span<const AnimationRecord> records,
                                  TriggerPolicy policy) {
  if (policy == TriggerPolicy::Lenient) {
    return {};
  }
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto frames = FindOutOfRangeTriggers(records[i]);
    if (!frames.empty()) {
      return std::unexpected(Error{
          .kind = ErrorKind::Validation,
          .code = ErrorCode::TriggerBeyondLastFrame,
          .message = fmt::format(
              "Record {}: trigger frame {} is not below frames_per_direction "
              "({})",
              records[i].identifier(), frames.front(),
              records[i].framesPerDirection()),
          .record = i,
          .field = "triggers",
      });
    }
  }
  return {};
}

} // namespace d2anim
