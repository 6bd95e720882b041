#include <algorithm>
#include <d2anim/Trigger.hpp>
#include <gtest/gtest.h>

namespace d2anim {
namespace {

Trigger T(s64 frame, s64 code) { return Trigger::Create(frame, code).value(); }

TEST(Trigger, AcceptsFullRange) {
  EXPECT_TRUE(Trigger::Create(0, 1));
  EXPECT_TRUE(Trigger::Create(143, 3));
}

TEST(Trigger, RejectsFrameOutOfRange) {
  for (s64 frame : {s64{-1}, s64{144}, s64{1000}}) {
    auto t = Trigger::Create(frame, 1);
    ASSERT_FALSE(t) << frame;
    EXPECT_EQ(t.error().kind, ErrorKind::Validation);
    EXPECT_EQ(t.error().code, ErrorCode::FrameOutOfRange);
    EXPECT_EQ(t.error().field, "triggers");
  }
}

TEST(Trigger, RejectsCodeOutOfRange) {
  for (s64 code : {s64{0}, s64{4}, s64{-1}, s64{255}}) {
    auto t = Trigger::Create(5, code);
    ASSERT_FALSE(t) << code;
    EXPECT_EQ(t.error().code, ErrorCode::CodeOutOfRange);
  }
}

TEST(TriggerSet, IteratesInFrameOrder) {
  auto set = TriggerSet::Create({T(10, 2), T(5, 1), T(143, 3)});
  ASSERT_TRUE(set);
  std::vector<u32> frames;
  for (const auto& t : *set) {
    frames.push_back(t.frame());
  }
  EXPECT_EQ(frames, (std::vector<u32>{5, 10, 143}));
  EXPECT_EQ(set->codeAt(10), 2);
  EXPECT_EQ(set->codeAt(11), std::nullopt);
}

TEST(TriggerSet, RejectsDuplicateFrame) {
  auto set = TriggerSet::Create({T(10, 1), T(3, 1), T(10, 2)});
  ASSERT_FALSE(set);
  EXPECT_EQ(set.error().kind, ErrorKind::Validation);
  EXPECT_EQ(set.error().code, ErrorCode::DuplicateTriggerFrame);
}

TEST(TriggerSet, RejectsDuplicateFrameWithSameCode) {
  auto set = TriggerSet::Create({T(10, 1), T(10, 1)});
  ASSERT_FALSE(set);
  EXPECT_EQ(set.error().code, ErrorCode::DuplicateTriggerFrame);
}

TEST(FrameCodes, EncodePlacesCodesAtFrames) {
  auto set = TriggerSet::Create({T(5, 1), T(10, 2)}).value();
  const FrameCodes codes = EncodeFrames(set);
  for (u32 i = 0; i < kFrameMax; ++i) {
    const u8 expected = i == 5 ? 1 : i == 10 ? 2 : 0;
    EXPECT_EQ(codes[i], expected) << i;
  }
}

TEST(FrameCodes, EmptySetEncodesToZeros) {
  const FrameCodes codes = EncodeFrames(TriggerSet{});
  EXPECT_TRUE(std::all_of(codes.begin(), codes.end(),
                          [](u8 c) { return c == 0; }));
}

TEST(FrameCodes, DecodeReportsRawValues) {
  FrameCodes codes{};
  codes[0] = 3;
  codes[7] = 200;
  codes[143] = 1;
  EXPECT_EQ(DecodeFrames(codes), (std::vector<RawTrigger>{
                                     {.frame = 0, .code = 3},
                                     {.frame = 7, .code = 200},
                                     {.frame = 143, .code = 1},
                                 }));
}

TEST(FrameCodes, FromFrameCodesValidates) {
  FrameCodes codes{};
  codes[20] = 4;
  auto set = TriggerSet::FromFrameCodes(codes);
  ASSERT_FALSE(set);
  EXPECT_EQ(set.error().code, ErrorCode::CodeOutOfRange);

  codes[20] = 3;
  set = TriggerSet::FromFrameCodes(codes);
  ASSERT_TRUE(set);
  EXPECT_EQ(set->size(), 1u);
  EXPECT_EQ(EncodeFrames(*set), codes);
}

} // namespace
} // namespace d2anim
