#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "gambit/engine_pool.hpp"
#include "gambit/error.hpp"
#include "gambit/game_state.hpp"
#include "gambit/orchestrator.hpp"
#include "gambit/session_store.hpp"

namespace gambit {

using json = nlohmann::json;

struct HttpOptions {
  std::size_t workers{8};
};

// REST front end. Each request runs on one of `workers` threads and calls
// straight into the orchestrator.
class HttpServer {
public:
  HttpServer(Orchestrator& orchestrator, EnginePool& engines, SessionStore& sessions,
             HttpOptions options);

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Blocks until stop() is called. Returns false if the address cannot be
  // bound.
  bool listen(const std::string& host, std::uint16_t port);

  // For tests: bind an ephemeral port, then serve from another thread.
  int bind_to_any_port(const std::string& host);
  bool listen_after_bind();
  void wait_until_ready();

  void stop();

private:
  void register_routes();

  Orchestrator& orchestrator_;
  EnginePool& engines_;
  SessionStore& sessions_;
  httplib::Server server_;
};

[[nodiscard]] int http_status(ErrorCode code) noexcept;

[[nodiscard]] json board_state_json(const GameState& state);
[[nodiscard]] json history_json(const GameState& state);

} // namespace gambit
