#include "gambit/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gambit::log {

namespace {

std::mutex g_sink_mutex;
std::ostream* g_sink = &std::clog;
std::atomic<Level> g_level{Level::Info};

std::string utc_timestamp() {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);

  char buffer[32];
  const auto len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buffer, len);
}

} // namespace

std::optional<Level> parse_level(std::string_view name) {
  if (name == "debug") {
    return Level::Debug;
  }
  if (name == "info") {
    return Level::Info;
  }
  if (name == "warning" || name == "warn") {
    return Level::Warning;
  }
  if (name == "error") {
    return Level::Error;
  }
  return std::nullopt;
}

std::string_view to_string(Level level) noexcept {
  switch (level) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warning:
    return "warning";
  case Level::Error:
    return "error";
  }
  return "info";
}

void set_sink(std::ostream& out) {
  std::scoped_lock lock(g_sink_mutex);
  g_sink = &out;
}

void reset_sink() {
  std::scoped_lock lock(g_sink_mutex);
  g_sink = &std::clog;
}

void set_level(Level level) {
  g_level.store(level, std::memory_order_relaxed);
}

Level level() {
  return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
  return static_cast<int>(lvl) >= static_cast<int>(level());
}

void write(Level lvl, std::string_view component, std::string_view message) {
  if (!enabled(lvl)) {
    return;
  }

  std::ostringstream line;
  line << utc_timestamp() << " [" << to_string(lvl) << "] " << component << ": " << message
       << '\n';

  std::scoped_lock lock(g_sink_mutex);
  *g_sink << line.str() << std::flush;
}

} // namespace gambit::log
