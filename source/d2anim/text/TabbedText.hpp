#pragma once

#include <core/common.h>
#include <d2anim/Record.hpp>

namespace d2anim {

namespace txt {
inline constexpr std::string_view kIdentifierColumn = "CofName";
inline constexpr std::string_view kFramesPerDirectionColumn =
    "FramesPerDirection";
inline constexpr std::string_view kSpeedColumn = "AnimationSpeed";

//! "FrameData000" .. "FrameData143"
std::string FrameColumn(u32 frame);
} // namespace txt

//! Parse a tab-separated table (Excel tab dialect) with one record per row.
//!
//! Columns are matched by header name, so order and extra columns do not
//! matter. Blank lines are skipped and an empty document holds no records.
//! Errors are `TabbedText` errors carrying the row and, where one is at
//! fault, the column. Rows count physical lines below the header from 0, so
//! skipped blank lines still advance the count.
Result<std::vector<AnimationRecord>> ReadTabbedText(std::string_view text);

//! One header row, then one CRLF-terminated row per record with all 144
//! frame codes spelled out.
std::string WriteTabbedText(std::span<const AnimationRecord> records);

} // namespace d2anim
