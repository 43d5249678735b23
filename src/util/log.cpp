#include "sitetrack/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "sitetrack/util/strings.h"

namespace sitetrack::log {
namespace {
std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};

void emit(Level l, const std::string& msg) {
  const Level cur = g_level.load();
  if (cur == Level::Off || l < cur) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

std::optional<Level> level_from_string(const std::string& s) {
  const std::string v = to_lower(trim_copy(s));
  if (v == "debug") return Level::Debug;
  if (v == "info") return Level::Info;
  if (v == "warn" || v == "warning") return Level::Warn;
  if (v == "error") return Level::Error;
  if (v == "off" || v == "none") return Level::Off;
  return std::nullopt;
}

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace sitetrack::log
