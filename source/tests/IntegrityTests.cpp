#include <d2anim/Integrity.hpp>
#include <gtest/gtest.h>

namespace d2anim {
namespace {

AnimationRecord Record(std::string_view identifier, u32 fpd,
                       std::vector<u32> trigger_frames = {}) {
  std::vector<Trigger> triggers;
  for (const u32 frame : trigger_frames) {
    triggers.push_back(Trigger::Create(frame, 1).value());
  }
  return AnimationRecord::Create(identifier, fpd, 256,
                                 TriggerSet::Create(std::move(triggers)).value())
      .value();
}

TEST(FindDuplicateIdentifiers, ReportsEachRepeat) {
  const std::vector<AnimationRecord> records{
      Record("A1HTH1H", 8), Record("S1BWHTH", 8), Record("A1HTH1H", 8),
      Record("A1HTH1H", 8), Record("S1BWHTH", 8),
  };
  EXPECT_EQ(FindDuplicateIdentifiers(records),
            (std::vector<std::string>{"A1HTH1H", "A1HTH1H", "S1BWHTH"}));
}

TEST(FindDuplicateIdentifiers, IsCaseSensitive) {
  const std::vector<AnimationRecord> records{Record("a1hth1h", 8),
                                             Record("A1HTH1H", 8)};
  EXPECT_TRUE(FindDuplicateIdentifiers(records).empty());
}

TEST(FindOutOfRangeTriggers, FrameAtOrPastCount) {
  EXPECT_EQ(FindOutOfRangeTriggers(Record("A1HTH1H", 10, {3, 9, 10, 40})),
            (std::vector<u32>{10, 40}));
  EXPECT_TRUE(FindOutOfRangeTriggers(Record("A1HTH1H", 10, {0, 9})).empty());
}

TEST(CheckRecords, DuplicatesThenTriggers) {
  const std::vector<AnimationRecord> records{
      Record("A1HTH1H", 4, {6}),
      Record("A1HTH1H", 8),
  };
  const auto diagnostics = CheckRecords(records);
  ASSERT_EQ(diagnostics.size(), 2u);
  EXPECT_EQ(diagnostics[0], (Diagnostic{
                                .kind = DiagnosticKind::DuplicateIdentifier,
                                .identifier = "A1HTH1H",
                            }));
  EXPECT_EQ(diagnostics[1], (Diagnostic{
                                .kind = DiagnosticKind::TriggerBeyondLastFrame,
                                .identifier = "A1HTH1H",
                                .frame = 6,
                                .frames_per_direction = 4,
                            }));
  EXPECT_EQ(diagnostics[0].message(), "Duplicate entry found: A1HTH1H");
}

TEST(CheckRecords, CleanInputHasNoDiagnostics) {
  const std::vector<AnimationRecord> records{Record("A1HTH1H", 8, {7}),
                                             Record("S1BWHTH", 8)};
  EXPECT_TRUE(CheckRecords(records).empty());
}

TEST(EnforceTriggerPolicy, LenientAcceptsEverything) {
  const std::vector<AnimationRecord> records{Record("A1HTH1H", 1, {100})};
  EXPECT_TRUE(EnforceTriggerPolicy(records, TriggerPolicy::Lenient));
}

TEST(EnforceTriggerPolicy, StrictRejectsFirstOffender) {
  const std::vector<AnimationRecord> records{
      Record("A1HTH1H", 8, {7}),
      Record("S1BWHTH", 8, {8}),
      Record("NUNU1HS", 2, {50}),
  };
  auto ok = EnforceTriggerPolicy(records, TriggerPolicy::Strict);
  ASSERT_FALSE(ok);
  EXPECT_EQ(ok.error().kind, ErrorKind::Validation);
  EXPECT_EQ(ok.error().code, ErrorCode::TriggerBeyondLastFrame);
  EXPECT_EQ(ok.error().record, 1u);
  EXPECT_EQ(ok.error().field, "triggers");
}

} // namespace
} // namespace d2anim
