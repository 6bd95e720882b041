#pragma once

#include <fmt/format.h>
#include <string_view>

namespace rsl {

namespace logging {

enum class Level {
  Error,
  Warn,
  Info,
  Debug,
  Trace,
};

//! Messages less severe than |threshold| are dropped. Until `init` is called
//! only warnings and errors are printed.
void init(Level threshold = Level::Trace);
bool enabled(Level level);

void debug(std::string_view s);
void error(std::string_view s);
void info(std::string_view s);
void log(Level level, std::string_view s);
void trace(std::string_view s);
void warn(std::string_view s);

template <typename... T>
inline void debug(fmt::format_string<T...> s, T&&... args) {
  if (!enabled(Level::Debug))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  debug(buf);
}
template <typename... T>
inline void error(fmt::format_string<T...> s, T&&... args) {
  auto buf = fmt::format(s, std::forward<T>(args)...);
  error(buf);
}
template <typename... T>
inline void info(fmt::format_string<T...> s, T&&... args) {
  if (!enabled(Level::Info))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  info(buf);
}
template <typename... T>
inline void log(Level level, fmt::format_string<T...> s, T&&... args) {
  if (!enabled(level))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  log(level, buf);
}
template <typename... T>
inline void trace(fmt::format_string<T...> s, T&&... args) {
  if (!enabled(Level::Trace))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  trace(buf);
}
template <typename... T>
inline void warn(fmt::format_string<T...> s, T&&... args) {
  auto buf = fmt::format(s, std::forward<T>(args)...);
  warn(buf);
}

} // namespace logging

using namespace logging;

} // namespace rsl
