// Log.cpp
#include "Log.hpp"
#include <atomic>
#include <cstdio>
#include <stdexcept>

namespace BloxScript {
namespace log {

namespace {
std::atomic<int> currentLevel(static_cast<int>(Level::Warn));
}

void setLevel(Level lvl) { currentLevel.store(static_cast<int>(lvl)); }

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<int>(lvl) >= currentLevel.load();
}

Level parseLevel(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

const char* levelTag(Level lvl) {
    switch (lvl) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: break;
    }
    return "";
}

void write(Level lvl, const std::string& message) {
    fmt::print(stderr, "[{}] {}\n", levelTag(lvl), message);
}

} // namespace log
} // namespace BloxScript
