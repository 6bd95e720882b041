#include "Error.hpp"

#include <magic_enum.hpp>

namespace d2anim {

std::string Error::describe() const {
  std::string context;
  const auto add = [&](std::string item) {
    context += context.empty() ? " (" : ", ";
    context += item;
  };
  if (offset) {
    add(fmt::format("offset=0x{:x}", *offset));
  }
  if (record) {
    add(fmt::format("record={}", *record));
  }
  if (!field.empty()) {
    add(fmt::format("field={}", field));
  }
  if (row) {
    add(fmt::format("row={}", *row));
  }
  if (column) {
    add(fmt::format("column={}", *column));
  }
  if (!column_name.empty()) {
    add(fmt::format("column_name={}", column_name));
  }
  if (!context.empty()) {
    context += ")";
  }
  return fmt::format("{}/{}: {}{}", magic_enum::enum_name(kind),
                     magic_enum::enum_name(code), message, context);
}

} // namespace d2anim
