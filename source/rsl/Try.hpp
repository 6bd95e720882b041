#pragma once

#include <type_traits>
#include <utility>

#include <rsl/Expected.hpp>

// clang-format off
//
// ```cpp
//    std::expected<int, Err> GetInt();
//    std::expected<int, Err> Foo() {
//       return TRY(GetInt()) + 5;
//    }
// ```
//
// - Move-only types work
// - Copy-only types work
// - Result<void> types work
//
// The error is forwarded unchanged, so the enclosing function must return an
// expected with the same error type (or one constructible from it).
//
template <typename T> auto MyMove(T&& t) {
  if constexpr (!std::is_void_v<typename std::remove_cvref_t<T>::value_type>) {
    return std::move(*t);
  }
}
#define TRY(...)                                                               \
  ({                                                                           \
    auto&& y = (__VA_ARGS__);                                                  \
    static_assert(!std::is_lvalue_reference_v<decltype(MyMove(y))>);           \
    if (!y) [[unlikely]] {                                                     \
      return RSL_UNEXPECTED(y.error());                                        \
    }                                                                          \
    MyMove(y);                                                                 \
  })
// clang-format on
