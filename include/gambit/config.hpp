#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gambit/log.hpp"
#include "gambit/session_store.hpp"

namespace gambit {

struct Config {
  std::string host{"0.0.0.0"};
  std::uint16_t port{5000};
  std::optional<std::string> engine_path{};
  std::uint8_t depth{1};
  std::size_t pool_size{default_pool_size()};
  std::chrono::seconds session_ttl{1800};
  std::chrono::seconds reap_interval{30};
  std::chrono::milliseconds engine_timeout{5000};
  std::chrono::milliseconds handshake_timeout{5000};
  std::chrono::milliseconds acquire_timeout{2000};
  std::size_t max_spawn_failures{3};
  std::size_t workers{8};
  BusyPolicy busy_policy{BusyPolicy::Reject};
  std::size_t engine_threads{1};
  log::Level log_level{log::Level::Info};
  bool show_help{false};

  // One engine per hardware thread, at least one.
  static std::size_t default_pool_size();
};

// Parses `--name value` options (program name excluded). Throws
// std::runtime_error naming the offending option.
Config parse_args(const std::vector<std::string>& args);

std::string usage(std::string_view program);

// Places a Stockfish binary is commonly found, most specific first. Bare names
// are looked up on PATH.
std::vector<std::string> engine_candidates();
std::optional<std::string> find_engine_binary(const std::vector<std::string>& candidates);

} // namespace gambit
