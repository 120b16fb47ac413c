// Log.hpp
//
// Leveled stderr logging on top of fmt. Lines are prefixed with the level tag
// ("[DEBUG] ...") so generator traces read the same as runtime output.
#pragma once
#include <fmt/core.h>
#include <string>
#include <utility>

namespace BloxScript {
namespace log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

void setLevel(Level level);
bool enabled(Level level);

// Parse "debug" | "info" | "warn" | "error" | "off"; throws std::invalid_argument otherwise
Level parseLevel(const std::string& name);
const char* levelTag(Level level);

void write(Level level, const std::string& message);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace log
} // namespace BloxScript
