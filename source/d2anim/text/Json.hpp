#pragma once

#include <core/common.h>
#include <d2anim/Record.hpp>

namespace d2anim {

//! Parse an array of record objects.
//!
//! Malformed documents and objects of the wrong shape are `Json` errors;
//! values that parse but break a field invariant are `Validation` errors.
//! Both carry the index of the offending record.
Result<std::vector<AnimationRecord>> ReadJson(std::string_view text);

//! Pretty-printed (2-space) array; triggers are written as an object keyed
//! by ascending frame.
std::string WriteJson(std::span<const AnimationRecord> records);

} // namespace d2anim
