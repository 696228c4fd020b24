#pragma once

#include <cstdio>
#include <utility>

#include <fmt/core.h>

namespace shpure::core::log {

enum struct Level {
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

void  set_level(Level level) noexcept;
Level level() noexcept;

template<typename... Args>
void write(Level lvl, char const* tag, fmt::format_string<Args...> format, Args&&... args) {
  if (lvl < level()) {
    return;
  }
  fmt::print(stderr, "[{}] {}\n", tag, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Debug, "debug", format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Info, "info", format, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Warn, "warn", format, std::forward<Args>(args)...);
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Error, "error", format, std::forward<Args>(args)...);
}

} // namespace shpure::core::log
