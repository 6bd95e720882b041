#include <algorithm>
#include <d2anim/io/AnimDataIO.hpp>
#include <gtest/gtest.h>

namespace d2anim {
namespace {

AnimationRecord Record(std::string_view identifier, u32 fpd = 20,
                       u32 speed = 256,
                       std::vector<std::pair<u32, u8>> triggers = {}) {
  std::vector<Trigger> list;
  for (auto [frame, code] : triggers) {
    list.push_back(Trigger::Create(frame, code).value());
  }
  return AnimationRecord::Create(identifier, fpd, speed,
                                 TriggerSet::Create(std::move(list)).value())
      .value();
}

u32 ReadU32(std::span<const u8> bytes, std::size_t at) {
  return bytes[at] | (bytes[at + 1] << 8) | (bytes[at + 2] << 16) |
         (static_cast<u32>(bytes[at + 3]) << 24);
}

// Offset of the first record of |bucket| in a table whose only non-empty
// bucket is |bucket|.
constexpr std::size_t FirstRecordOffset(u32 bucket) {
  return (bucket + 1) * sizeof(u32);
}

TEST(AnimData, EmptyTableIs256ZeroCounts) {
  const auto bytes = WriteAnimData({});
  ASSERT_EQ(bytes.size(), 1024u);
  EXPECT_TRUE(std::all_of(bytes.begin(), bytes.end(),
                          [](u8 b) { return b == 0; }));

  auto records = ReadAnimData(bytes);
  ASSERT_TRUE(records) << records.error().describe();
  EXPECT_TRUE(records->empty());
}

TEST(AnimData, EncodesSingleRecordLayout) {
  const auto record = Record("AAAAAAA", 20, 256, {{5, 1}, {10, 2}});
  const std::vector<AnimationRecord> records{record};
  const auto bytes = WriteAnimData(records);
  ASSERT_EQ(bytes.size(), 1024u + 160u);
  ASSERT_EQ(bytes.size(), ComputeAnimDataSize(1));

  const u32 bucket = HashIdentifier("AAAAAAA");
  ASSERT_EQ(bucket, 199u);
  for (u32 b = 0; b < bucket; ++b) {
    EXPECT_EQ(ReadU32(bytes, b * 4), 0u) << b;
  }
  EXPECT_EQ(ReadU32(bytes, bucket * 4), 1u);

  const std::size_t at = FirstRecordOffset(bucket);
  const std::string_view name(reinterpret_cast<const char*>(&bytes[at]), 8);
  EXPECT_EQ(name, std::string_view("AAAAAAA\0", 8));
  EXPECT_EQ(ReadU32(bytes, at + 8), 20u);
  EXPECT_EQ(ReadU32(bytes, at + 12), 256u);
  // Speed is little-endian: 00 01 00 00
  EXPECT_EQ(bytes[at + 12], 0x00);
  EXPECT_EQ(bytes[at + 13], 0x01);
  for (u32 frame = 0; frame < kFrameMax; ++frame) {
    const u8 expected = frame == 5 ? 1 : frame == 10 ? 2 : 0;
    EXPECT_EQ(bytes[at + 16 + frame], expected) << frame;
  }
  for (u32 b = bucket + 1; b < kBucketCount; ++b) {
    EXPECT_EQ(ReadU32(bytes, at + 160 + (b - bucket - 1) * 4), 0u) << b;
  }

  auto decoded = ReadAnimData(bytes);
  ASSERT_TRUE(decoded) << decoded.error().describe();
  ASSERT_EQ(decoded->size(), 1u);
  EXPECT_EQ(decoded->front(), record);
}

TEST(AnimData, DecodesInBucketOrderKeepingDuplicates) {
  // "BAAAAAA" hashes one above "AAAAAAA"; "aaaaaaa" collides with it
  const std::vector<AnimationRecord> records{
      Record("BAAAAAA", 1),
      Record("AAAAAAA", 2),
      Record("aaaaaaa", 3),
      Record("AAAAAAA", 4),
  };
  auto decoded = ReadAnimData(WriteAnimData(records));
  ASSERT_TRUE(decoded) << decoded.error().describe();
  ASSERT_EQ(decoded->size(), 4u);
  EXPECT_EQ((*decoded)[0], records[1]);
  EXPECT_EQ((*decoded)[1], records[2]);
  EXPECT_EQ((*decoded)[2], records[3]);
  EXPECT_EQ((*decoded)[3], records[0]);
}

TEST(AnimData, RebuildIsByteIdentical) {
  const std::vector<AnimationRecord> records{
      Record("A1HTH1H", 8, 256, {{0, 1}, {143, 3}}),
      Record("S1BWHTH", 16, 128),
      Record("NUNU1HS", 12, 256, {{6, 2}}),
  };
  const auto bytes = WriteAnimData(records);
  auto decoded = ReadAnimData(bytes);
  ASSERT_TRUE(decoded) << decoded.error().describe();
  EXPECT_EQ(WriteAnimData(*decoded), bytes);
}

TEST(AnimData, TrailingByteIsSizeMismatch) {
  auto bytes = WriteAnimData(std::vector{Record("AAAAAAA")});
  bytes.push_back(0);
  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Format);
  EXPECT_EQ(decoded.error().code, ErrorCode::SizeMismatch);
  EXPECT_EQ(decoded.error().offset, 1024u + 160u);
}

TEST(AnimData, MissingByteIsTruncation) {
  auto bytes = WriteAnimData(std::vector{Record("AAAAAAA")});
  bytes.pop_back();
  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Format);
  EXPECT_EQ(decoded.error().code, ErrorCode::Truncated);
}

TEST(AnimData, TruncationInsideFrameCodesReportsRecordOffset) {
  auto bytes = WriteAnimData(std::vector{Record("AAAAAAA")});
  const std::size_t at = FirstRecordOffset(HashIdentifier("AAAAAAA"));
  bytes.resize(at + 16 + 50);
  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Format);
  EXPECT_EQ(decoded.error().code, ErrorCode::Truncated);
  EXPECT_EQ(decoded.error().offset, at);
}

TEST(AnimData, RecordInWrongBucketIsRejected) {
  // Move the record of bucket 199 into bucket 0
  const auto good = WriteAnimData(std::vector{Record("AAAAAAA")});
  const std::size_t at = FirstRecordOffset(HashIdentifier("AAAAAAA"));
  std::vector<u8> bytes(1024 + 160, 0);
  bytes[0] = 1;
  std::copy_n(good.begin() + at, 160, bytes.begin() + 4);

  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Data);
  EXPECT_EQ(decoded.error().code, ErrorCode::BucketMismatch);
  EXPECT_EQ(decoded.error().offset, 4u);
}

TEST(AnimData, InvalidTriggerCodeIsDataError) {
  auto bytes = WriteAnimData(std::vector{Record("AAAAAAA")});
  const std::size_t at = FirstRecordOffset(HashIdentifier("AAAAAAA"));
  bytes[at + 16 + 7] = 4;
  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Data);
  EXPECT_EQ(decoded.error().code, ErrorCode::CodeOutOfRange);
  EXPECT_EQ(decoded.error().offset, at);
}

TEST(AnimData, ShortIdentifierIsDataError) {
  auto bytes = WriteAnimData(std::vector{Record("AAAAAAA")});
  const std::size_t at = FirstRecordOffset(HashIdentifier("AAAAAAA"));
  bytes[at + 3] = 0;
  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Data);
  EXPECT_EQ(decoded.error().code, ErrorCode::IdentifierLength);
}

TEST(AnimData, NonAsciiIdentifierIsDataError) {
  auto bytes = WriteAnimData(std::vector{Record("AAAAAAA")});
  const std::size_t at = FirstRecordOffset(HashIdentifier("AAAAAAA"));
  bytes[at + 2] = 0xC1;
  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Data);
  EXPECT_EQ(decoded.error().code, ErrorCode::IdentifierNotAscii);
}

TEST(AnimData, ShortHeaderIsTruncation) {
  const std::vector<u8> bytes(3, 0);
  auto decoded = ReadAnimData(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Format);
  EXPECT_EQ(decoded.error().code, ErrorCode::Truncated);
  EXPECT_EQ(decoded.error().offset, 0u);
}

} // namespace
} // namespace d2anim
