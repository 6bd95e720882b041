#pragma once

#include <core/common.h>
#include <magic_enum.hpp>

namespace rsl {

static inline std::string EnumError(std::string_view bad, auto&& good) {
  std::string values_printed;
  for (const auto& [id, name] : good) {
    if (!values_printed.empty()) {
      values_printed += ", ";
    }
    values_printed += name;
  }
  return fmt::format(
      "Invalid enum value. Expected one of ({}). Instead saw \"{}\".",
      values_printed, bad);
}

template <typename E>
inline std::expected<E, std::string> enum_cast(std::string_view candidate) {
  auto as_enum = magic_enum::enum_cast<E>(candidate);
  if (!as_enum.has_value()) {
    auto values = magic_enum::enum_entries<E>();
    auto msg = EnumError(candidate, values);
    return RSL_UNEXPECTED(msg);
  }
  return *as_enum;
}

} // namespace rsl
