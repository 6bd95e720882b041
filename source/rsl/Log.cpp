#include "Log.hpp"

#include <atomic>
#include <cstdio>
#include <fmt/color.h>

namespace rsl {
namespace logging {

static std::atomic<Level> s_threshold = Level::Warn;

static fmt::text_style StyleOf(Level level) {
  switch (level) {
  case Level::Error:
    return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  case Level::Warn:
    return fmt::fg(fmt::terminal_color::yellow);
  case Level::Info:
    return fmt::fg(fmt::terminal_color::green);
  case Level::Debug:
    return fmt::fg(fmt::terminal_color::cyan);
  case Level::Trace:
    return fmt::fg(fmt::terminal_color::bright_black);
  }
  return {};
}

static std::string_view TagOf(Level level) {
  switch (level) {
  case Level::Error:
    return "ERROR";
  case Level::Warn:
    return "WARN";
  case Level::Info:
    return "INFO";
  case Level::Debug:
    return "DEBUG";
  case Level::Trace:
    return "TRACE";
  }
  return "?";
}

void init(Level threshold) { s_threshold = threshold; }
bool enabled(Level level) {
  return static_cast<int>(level) <= static_cast<int>(s_threshold.load());
}

void log(Level l, std::string_view s) {
  if (!enabled(l)) {
    return;
  }
  fmt::print(stderr, StyleOf(l), "{}", TagOf(l));
  fmt::print(stderr, ": {}\n", s);
}

void debug(std::string_view s) { log(Level::Debug, s); }
void error(std::string_view s) { log(Level::Error, s); }
void info(std::string_view s) { log(Level::Info, s); }
void trace(std::string_view s) { log(Level::Trace, s); }
void warn(std::string_view s) { log(Level::Warn, s); }

} // namespace logging
} // namespace rsl
