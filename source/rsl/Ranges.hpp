#pragma once

#include <algorithm>
#include <array>
#include <ranges>

namespace rsl {

template <size_t N, typename T> struct ArrayCollector {};

template <size_t N, typename T = void> static auto ToArray() {
  return ArrayCollector<N, T>{};
}

} // namespace rsl

template <size_t N, typename T>
static auto operator|(auto&& range, rsl::ArrayCollector<N, T>&&) {
  // Value of each item in the range
  using FallbackValueT = std::ranges::range_value_t<decltype(range)>;
  // If the typename T overload is picked, use it; otherwise default
  constexpr bool IsCustomValueT = !std::is_void_v<T>;
  using ValueT = std::conditional_t<IsCustomValueT, T, FallbackValueT>;

  auto size = static_cast<size_t>(std::ranges::size(range));
  std::array<ValueT, N> arr;
  std::copy_n(range.begin(), std::min(size, arr.size()), arr.begin());
  ValueT dv{};
  std::fill(arr.begin() + std::min(size, arr.size()), arr.end(), dv);
  return arr;
}
