// log.hpp: leveled stderr logging ("LEVEL: message")
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace antsim::log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

void set_level(Level lvl);
Level level();
bool enabled(Level lvl);

// Accepts debug|info|warn|error|off (case-insensitive).
std::optional<Level> parse_level(std::string_view s);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace antsim::log
