#pragma once

#include "Expected.hpp"
#include <fmt/format.h>
#include <string>

// clang: Merged May 16 2019, Clang 9
// GCC:   Merged May 20 2021, GCC 12 (likely to release April 2022)
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

//! Early-return an untyped `Result` when `expr` does not hold.
#define EXPECT(expr, ...)                                                      \
  if (!(expr)) [[unlikely]] {                                                  \
    return RSL_UNEXPECTED(fmt::format("[{}:{}] {} [Internal: {}]",             \
                                      __FILE_NAME__, __LINE__,                 \
                                      std::string(__VA_ARGS__), #expr));       \
  }
