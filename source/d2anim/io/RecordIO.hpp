#pragma once

#include <core/common.h>
#include <d2anim/Record.hpp>
#include <oishii/writer/binary_writer.hxx>
#include <rsl/SafeReader.hpp>

namespace d2anim {

namespace bin {
//! Null-padded identifier field
inline constexpr u32 kIdentifierFieldSize = 8;
//! identifier, frames_per_direction, speed, frame codes
inline constexpr u32 kRecordSize = kIdentifierFieldSize + 4 + 4 + kFrameMax;
static_assert(kRecordSize == 160);
} // namespace bin

//! Read one fixed-size record at the cursor. Errors carry the offset of the
//! record's first byte.
//!
//! - `Format`: the stream ends inside the record.
//! - `Data`: the bytes decode to an invalid record.
Result<AnimationRecord> ReadRecord(rsl::SafeReader& reader);
void WriteRecord(oishii::Writer& writer, const AnimationRecord& record);

} // namespace d2anim
