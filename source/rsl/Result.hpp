#pragma once

#include "Expected.hpp"
#include <string>

//! Untyped failure: used by the stream layer and file helpers, where the
//! message is all the caller needs.
template <typename T, typename E = std::string>
using Result = std::expected<T, E>;
