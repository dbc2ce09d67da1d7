#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace gambit::log {

enum class Level { Debug, Info, Warning, Error };

[[nodiscard]] std::optional<Level> parse_level(std::string_view name);
[[nodiscard]] std::string_view to_string(Level level) noexcept;

// Process-wide sink. Defaults to std::clog at Info. Lines are written whole
// under a mutex, so concurrent writers never interleave.
void set_sink(std::ostream& out);
void reset_sink();
void set_level(Level level);
[[nodiscard]] Level level();
[[nodiscard]] bool enabled(Level level);

void write(Level level, std::string_view component, std::string_view message);

inline void debug(std::string_view component, std::string_view message) {
  write(Level::Debug, component, message);
}

inline void info(std::string_view component, std::string_view message) {
  write(Level::Info, component, message);
}

inline void warning(std::string_view component, std::string_view message) {
  write(Level::Warning, component, message);
}

inline void error(std::string_view component, std::string_view message) {
  write(Level::Error, component, message);
}

} // namespace gambit::log
