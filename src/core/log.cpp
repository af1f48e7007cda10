#include "antsim/core/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace antsim::log {
namespace {

std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};

const char* label(Level l) {
    switch (l) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        default:           return "";
    }
}

void emit(Level l, const std::string& msg) {
    if (!enabled(l)) return;
    std::lock_guard<std::mutex> lock(g_mu);
    std::cerr << label(l) << ": " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl, std::memory_order_relaxed); }
Level level() { return g_level.load(std::memory_order_relaxed); }

bool enabled(Level lvl) {
    const Level cur = level();
    return cur != Level::Off && lvl != Level::Off && lvl >= cur;
}

std::optional<Level> parse_level(std::string_view s) {
    std::string t; t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "debug")                  return Level::Debug;
    if (t == "info")                   return Level::Info;
    if (t == "warn" || t == "warning") return Level::Warn;
    if (t == "error")                  return Level::Error;
    if (t == "off" || t == "none")     return Level::Off;
    return std::nullopt;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg)  { emit(Level::Info, msg); }
void warn(const std::string& msg)  { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace antsim::log
