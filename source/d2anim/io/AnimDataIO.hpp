#pragma once

#include <core/common.h>
#include <d2anim/Hash.hpp>
#include <d2anim/Record.hpp>
#include <d2anim/io/RecordIO.hpp>

namespace d2anim {

//! Decode a whole animation table.
//!
//! Records come out bucket by bucket (0 to 255), in file order within each
//! bucket. Every record must sit in the bucket of its identifier's hash and
//! the buckets must account for every byte of |data|.
Result<std::vector<AnimationRecord>>
ReadAnimData(std::span<const u8> data, std::string_view path = "Unknown path");

//! Encode |records| into the 256-bucket table. Records are routed to
//! `HashIdentifier(identifier)` in input order; duplicates are kept.
std::vector<u8> WriteAnimData(std::span<const AnimationRecord> records);

//! Size in bytes of the table holding |record_count| records.
constexpr std::size_t ComputeAnimDataSize(std::size_t record_count) {
  return kBucketCount * sizeof(u32) + record_count * bin::kRecordSize;
}

} // namespace d2anim
