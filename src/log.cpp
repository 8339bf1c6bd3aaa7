// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================
#include "ventobridge/log.hpp"

#include <atomic>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace ventobridge::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex       g_mu;           // guards g_file and interleaving of lines
std::ofstream    g_file;

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
  }
  return "?";
}

// UTC, second resolution; enough to line up with broker logs.
std::string timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

} // namespace

void set_level(Level lvl) { g_level.store(static_cast<int>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) { return static_cast<int>(lvl) >= g_level.load(); }

bool open_file(const std::string& path) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_file.is_open()) g_file.close();
  g_file.open(path, std::ios::out | std::ios::app);
  return g_file.is_open();
}

void close_file() {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_file.is_open()) g_file.close();
}

void write(Level lvl, const std::string& line) {
  if (!enabled(lvl)) return;
  const std::string rec = timestamp() + " [" + level_name(lvl) + "] " + line + "\n";

  std::lock_guard<std::mutex> lock(g_mu);
  if (g_file.is_open()) {
    g_file << rec;
    g_file.flush();
  } else {
    std::cerr << rec;
  }
}

} // namespace ventobridge::log
