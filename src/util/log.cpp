#include "settlesim/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "settlesim/util/strings.h"
#include "settlesim/util/time.h"

namespace settlesim::log {
namespace {
std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};
Sink g_sink;

void emit(Level l, const std::string& msg) {
  const Level cur = g_level.load();
  if (cur == Level::Off || l < cur) return;
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_sink) {
    g_sink(l, msg);
    return;
  }
  std::cerr << format_iso8601(now_epoch_ms()) << " [" << level_label(l) << "] " << msg << "\n";
}

} // namespace

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

bool parse_level(const std::string& text, Level* out) {
  const std::string s = to_lower(text);
  Level l;
  if (s == "debug") {
    l = Level::Debug;
  } else if (s == "info") {
    l = Level::Info;
  } else if (s == "warn" || s == "warning") {
    l = Level::Warn;
  } else if (s == "error") {
    l = Level::Error;
  } else if (s == "off" || s == "none") {
    l = Level::Off;
  } else {
    return false;
  }
  if (out) *out = l;
  return true;
}

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace settlesim::log
