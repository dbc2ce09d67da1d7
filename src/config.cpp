#include "gambit/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <unistd.h>

namespace gambit {

namespace {

long long parse_integer(const std::string& option, const std::string& value, long long min,
                        long long max) {
  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid value for '" + option + "': " + value);
  }

  if (consumed != value.size()) {
    throw std::runtime_error("invalid value for '" + option + "': " + value);
  }
  if (parsed < min || parsed > max) {
    throw std::runtime_error("value for '" + option + "' must be between " +
                             std::to_string(min) + " and " + std::to_string(max));
  }
  return parsed;
}

bool is_executable(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> search_path(const std::string& name) {
  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }

  std::istringstream dirs{std::string(path_env)};
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const auto candidate = std::filesystem::path(dir) / name;
    if (is_executable(candidate)) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

using Setter = std::function<void(Config&, const std::string&, const std::string&)>;

const std::map<std::string, Setter, std::less<>>& setters() {
  constexpr long long MAX_MS = 24LL * 60 * 60 * 1000;
  constexpr long long MAX_S = 7LL * 24 * 60 * 60;

  static const std::map<std::string, Setter, std::less<>> table{
      {"--host", [](Config& c, const std::string&, const std::string& v) { c.host = v; }},
      {"--port",
       [](Config& c, const std::string& o, const std::string& v) {
         c.port = static_cast<std::uint16_t>(parse_integer(o, v, 1, 65535));
       }},
      {"--engine", [](Config& c, const std::string&, const std::string& v) { c.engine_path = v; }},
      {"--depth",
       [](Config& c, const std::string& o, const std::string& v) {
         c.depth = static_cast<std::uint8_t>(parse_integer(o, v, 1, 20));
       }},
      {"--pool-size",
       [](Config& c, const std::string& o, const std::string& v) {
         c.pool_size = static_cast<std::size_t>(parse_integer(o, v, 1, 256));
       }},
      {"--session-ttl",
       [](Config& c, const std::string& o, const std::string& v) {
         c.session_ttl = std::chrono::seconds{parse_integer(o, v, 1, MAX_S)};
       }},
      {"--reap-interval",
       [](Config& c, const std::string& o, const std::string& v) {
         c.reap_interval = std::chrono::seconds{parse_integer(o, v, 1, MAX_S)};
       }},
      {"--engine-timeout",
       [](Config& c, const std::string& o, const std::string& v) {
         c.engine_timeout = std::chrono::milliseconds{parse_integer(o, v, 1, MAX_MS)};
       }},
      {"--handshake-timeout",
       [](Config& c, const std::string& o, const std::string& v) {
         c.handshake_timeout = std::chrono::milliseconds{parse_integer(o, v, 1, MAX_MS)};
       }},
      {"--acquire-timeout",
       [](Config& c, const std::string& o, const std::string& v) {
         c.acquire_timeout = std::chrono::milliseconds{parse_integer(o, v, 0, MAX_MS)};
       }},
      {"--max-spawn-failures",
       [](Config& c, const std::string& o, const std::string& v) {
         c.max_spawn_failures = static_cast<std::size_t>(parse_integer(o, v, 1, 100));
       }},
      {"--workers",
       [](Config& c, const std::string& o, const std::string& v) {
         c.workers = static_cast<std::size_t>(parse_integer(o, v, 1, 1024));
       }},
      {"--engine-threads",
       [](Config& c, const std::string& o, const std::string& v) {
         c.engine_threads = static_cast<std::size_t>(parse_integer(o, v, 1, 1024));
       }},
      {"--busy-policy",
       [](Config& c, const std::string& o, const std::string& v) {
         if (v == "reject") {
           c.busy_policy = BusyPolicy::Reject;
         } else if (v == "queue") {
           c.busy_policy = BusyPolicy::Queue;
         } else {
           throw std::runtime_error("invalid value for '" + o + "': " + v);
         }
       }},
      {"--log-level",
       [](Config& c, const std::string& o, const std::string& v) {
         const auto level = log::parse_level(v);
         if (!level.has_value()) {
           throw std::runtime_error("invalid value for '" + o + "': " + v);
         }
         c.log_level = *level;
       }},
  };
  return table;
}

} // namespace

std::size_t Config::default_pool_size() {
  const auto cores = std::thread::hardware_concurrency();
  return cores == 0 ? 1 : static_cast<std::size_t>(cores);
}

Config parse_args(const std::vector<std::string>& args) {
  Config config;

  for (std::size_t i = 0; i < args.size();) {
    const std::string& option = args[i];

    if (option == "--help" || option == "-h") {
      config.show_help = true;
      ++i;
      continue;
    }

    const auto setter = setters().find(option);
    if (setter == setters().end()) {
      throw std::runtime_error("unknown option '" + option + "'");
    }

    if (i + 1 >= args.size()) {
      throw std::runtime_error("missing value for '" + option + "'");
    }

    setter->second(config, option, args[i + 1]);
    i += 2;
  }

  return config;
}

std::string usage(std::string_view program) {
  std::ostringstream out;
  out << "usage: " << program << " [options]\n"
      << "\n"
      << "  --host ADDR               bind address (default 0.0.0.0)\n"
      << "  --port N                  bind port (default 5000)\n"
      << "  --engine PATH             UCI engine binary (default: search for stockfish)\n"
      << "  --depth N                 default search depth, 1-20 (default 1)\n"
      << "  --pool-size N             engine processes (default: hardware threads)\n"
      << "  --session-ttl SECONDS     idle time before a session is dropped (default 1800)\n"
      << "  --reap-interval SECONDS   how often idle sessions are swept (default 30)\n"
      << "  --engine-timeout MS       engine reply timeout (default 5000)\n"
      << "  --handshake-timeout MS    engine start-up timeout (default 5000)\n"
      << "  --acquire-timeout MS      wait for a free engine (default 2000)\n"
      << "  --max-spawn-failures N    failed restarts before the pool degrades (default 3)\n"
      << "  --workers N               HTTP worker threads (default 8)\n"
      << "  --busy-policy reject|queue  concurrent requests on one session (default reject)\n"
      << "  --engine-threads N        engine 'Threads' option (default 1)\n"
      << "  --log-level LEVEL         debug, info, warning or error (default info)\n"
      << "  --help                    show this message\n";
  return out.str();
}

std::vector<std::string> engine_candidates() {
  return {
      "./stockfish",
      "./stockfish/stockfish",
      "/usr/bin/stockfish",
      "/usr/local/bin/stockfish",
      "/usr/games/stockfish",
      "stockfish",
  };
}

std::optional<std::string> find_engine_binary(const std::vector<std::string>& candidates) {
  for (const auto& candidate : candidates) {
    if (candidate.find('/') == std::string::npos) {
      if (auto found = search_path(candidate)) {
        return found;
      }
      continue;
    }

    if (is_executable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace gambit
