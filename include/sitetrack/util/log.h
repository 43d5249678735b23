#pragma once

#include <optional>
#include <string>

namespace sitetrack::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Accepts "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
std::optional<Level> level_from_string(const std::string& s);
const char* level_label(Level lvl);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace sitetrack::log
