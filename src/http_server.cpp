#include "gambit/http_server.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <functional>
#include <optional>
#include <utility>

#include "gambit/about.hpp"
#include "gambit/log.hpp"

namespace gambit {

namespace {

constexpr std::string_view COMPONENT = "http";
constexpr const char* JSON_TYPE = "application/json";
constexpr const char* PGN_TYPE = "application/x-chess-pgn";

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
  const auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buffer[32];
  const auto len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buffer, len);
}

void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), JSON_TYPE);
}

void send_error(httplib::Response& res, const Error& ex) {
  send_json(res, http_status(ex.code()),
            json{{"success", false}, {"error", ex.what()}, {"code", std::string(to_string(ex.code()))}});
}

json parse_body(const httplib::Request& req) {
  if (req.body.empty()) {
    return json::object();
  }

  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw Error(ErrorCode::BadRequest, "Request body must be a JSON object");
  }
  return body;
}

std::optional<std::string> optional_string(const json& body, const char* key) {
  const auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw Error(ErrorCode::BadRequest, std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<long long> optional_integer(const json& body, const char* key) {
  const auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    throw Error(ErrorCode::BadRequest, std::string(key) + " must be an integer");
  }
  return it->get<long long>();
}

std::string require_session_id(const httplib::Request& req, const json& body) {
  if (auto id = optional_string(body, "session_id")) {
    return *id;
  }
  if (req.has_param("session_id")) {
    return req.get_param_value("session_id");
  }
  throw Error(ErrorCode::BadRequest, "session_id required");
}

json snapshot_json(const Snapshot& snapshot) {
  return json{
      {"success", true},
      {"session_id", snapshot.session_id},
      {"position", snapshot.state.fen()},
      {"status", std::string(to_string(snapshot.state.status()))},
      {"phase", std::string(to_string(snapshot.phase))},
      {"difficulty", snapshot.depth},
      {"board_state", board_state_json(snapshot.state)},
  };
}

// Runs `fn`, turning exceptions into JSON error responses. Service errors map
// through http_status(); anything else is a 500 and is logged.
void guarded(const httplib::Request& req, httplib::Response& res,
             const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error& ex) {
    if (error_class(ex.code()) == ErrorClass::Infrastructure ||
        error_class(ex.code()) == ErrorClass::Fatal) {
      log::error(COMPONENT, req.method + " " + req.path + ": " +
                                std::string(to_string(ex.code())) + ": " + ex.what());
    }
    send_error(res, ex);
  } catch (const json::exception& ex) {
    send_error(res, Error(ErrorCode::BadRequest, ex.what()));
  } catch (const std::exception& ex) {
    log::error(COMPONENT, req.method + " " + req.path + ": " + ex.what());
    send_json(res, 500, json{{"success", false}, {"error", ex.what()}});
  }
}

} // namespace

int http_status(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::InvalidMove:
  case ErrorCode::NothingToUndo:
    return 200;
  case ErrorCode::BadRequest:
    return 400;
  case ErrorCode::SessionNotFound:
    return 404;
  case ErrorCode::SessionBusy:
  case ErrorCode::GameOver:
    return 409;
  case ErrorCode::EngineTimeout:
  case ErrorCode::EngineUnavailable:
  case ErrorCode::EngineProtocolError:
  case ErrorCode::PoolTimeout:
  case ErrorCode::Cancelled:
    return 500;
  case ErrorCode::EnginePoolDegraded:
    return 503;
  }
  return 500;
}

json board_state_json(const GameState& state) {
  return json{
      {"fen", state.fen()},
      {"turn", std::string(to_string(state.side_to_move()))},
      {"is_check", state.in_check()},
      {"is_checkmate", state.status() == GameStatus::Checkmate},
      {"is_stalemate", state.status() == GameStatus::Stalemate},
      {"is_game_over", state.is_over()},
      {"legal_moves", state.legal_moves()},
      {"move_count", state.move_count()},
  };
}

json history_json(const GameState& state) {
  json moves = json::array();
  for (const auto& record : state.history()) {
    moves.push_back(json{
        {"move", record.uci},
        {"san", record.san},
        {"player", std::string(to_string(record.player))},
        {"timestamp", iso_timestamp(record.played_at)},
    });
  }
  return moves;
}

HttpServer::HttpServer(Orchestrator& orchestrator, EnginePool& engines, SessionStore& sessions,
                       HttpOptions options)
    : orchestrator_(orchestrator), engines_(engines), sessions_(sessions) {
  const auto workers = options.workers == 0 ? std::size_t{1} : options.workers;
  server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

  server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    if (log::enabled(log::Level::Debug)) {
      log::debug(COMPONENT, req.method + " " + req.path + " -> " + std::to_string(res.status));
    }
  });

  register_routes();
}

bool HttpServer::listen(const std::string& host, std::uint16_t port) {
  log::info(COMPONENT, "listening on " + host + ":" + std::to_string(port));
  return server_.listen(host, port);
}

int HttpServer::bind_to_any_port(const std::string& host) {
  return server_.bind_to_any_port(host);
}

bool HttpServer::listen_after_bind() {
  return server_.listen_after_bind();
}

void HttpServer::wait_until_ready() {
  server_.wait_until_ready();
}

void HttpServer::stop() {
  server_.stop();
}

void HttpServer::register_routes() {
  server_.Post("/new_game", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json body = parse_body(req);
      const auto snapshot = orchestrator_.new_game(optional_string(body, "session_id"),
                                                   optional_integer(body, "difficulty"));
      send_json(res, 200, snapshot_json(snapshot));
    });
  });

  server_.Post("/move", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json body = parse_body(req);
      const auto session_id = require_session_id(req, body);
      const auto move = optional_string(body, "move");
      if (!move.has_value() || move->empty()) {
        throw Error(ErrorCode::BadRequest, "Move required");
      }

      const CancelCheck cancelled = [&req] {
        return req.is_connection_closed && req.is_connection_closed();
      };
      const auto result = orchestrator_.submit_move(session_id, *move, cancelled);
      const auto& state = result.snapshot.state;

      json reply{
          {"success", result.success},
          {"position", state.fen()},
          {"status", std::string(to_string(state.status()))},
          {"phase", std::string(to_string(result.snapshot.phase))},
      };

      if (result.success) {
        reply["engine_move"] =
            result.engine_move.has_value() ? json(*result.engine_move) : json(nullptr);
        reply["game_over"] = state.is_over();
        reply["board_state"] = board_state_json(state);
      } else {
        reply["error"] = result.error;
      }

      send_json(res, 200, reply);
    });
  });

  server_.Get("/status", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const auto snapshot = orchestrator_.status(require_session_id(req, json::object()));
      json reply = snapshot_json(snapshot);
      reply["history"] = history_json(snapshot.state);
      reply["result"] = snapshot.state.result();
      send_json(res, 200, reply);
    });
  });

  server_.Get("/pgn", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      res.status = 200;
      res.set_content(orchestrator_.pgn(require_session_id(req, json::object())), PGN_TYPE);
    });
  });

  server_.Post("/undo", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json body = parse_body(req);
      try {
        send_json(res, 200, snapshot_json(orchestrator_.undo(require_session_id(req, body))));
      } catch (const Error& ex) {
        if (ex.code() != ErrorCode::NothingToUndo) {
          throw;
        }
        send_json(res, 200, json{{"success", false}, {"error", ex.what()}});
      }
    });
  });

  server_.Post("/resign", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json body = parse_body(req);
      json reply = snapshot_json(orchestrator_.resign(require_session_id(req, body)));
      send_json(res, 200, reply);
    });
  });

  server_.Post("/difficulty", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json body = parse_body(req);
      const auto session_id = require_session_id(req, body);
      const auto level = optional_integer(body, "level");
      if (!level.has_value()) {
        throw Error(ErrorCode::BadRequest, "level required");
      }
      const auto depth = orchestrator_.set_difficulty(session_id, *level);
      send_json(res, 200, json{{"success", true}, {"difficulty", depth}});
    });
  });

  server_.Post("/end_game", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json body = parse_body(req);
      orchestrator_.end_game(require_session_id(req, body));
      send_json(res, 200, json{{"success", true}});
    });
  });

  server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const auto stats = engines_.stats();
      send_json(res, stats.degraded ? 503 : 200,
                json{
                    {"service", service_name()},
                    {"version", service_version()},
                    {"sessions", sessions_.size()},
                    {"pool",
                     {
                         {"size", stats.size},
                         {"idle", stats.idle},
                         {"busy", stats.busy},
                         {"vacant", stats.vacant},
                         {"degraded", stats.degraded},
                         {"spawned", stats.spawned},
                         {"crashed", stats.crashed},
                     }},
                });
    });
  });

  server_.Post("/admin/reset_pool", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const auto spawned = engines_.reset();
      send_json(res, 200, json{{"success", !engines_.degraded()}, {"spawned", spawned}});
    });
  });
}

} // namespace gambit
