#pragma once

#include <fmt/format.h>

#include <atomic>
#include <iostream>
#include <string>
#include <utility>

namespace streamfs::log {

enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3 };

extern std::atomic<Level> g_level;

inline void set_level(Level level) { g_level.store(level); }
inline bool enabled(Level level) { return level >= g_level.load(); }

void write(Level level, const std::string& message);

template <typename... Args> void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Debug)) write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args> void info(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Info)) write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args> void warning(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Warning)) {
    write(Level::Warning, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args> void error(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Error)) write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace streamfs::log
