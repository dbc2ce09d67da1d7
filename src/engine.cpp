#include "gambit/engine.hpp"

#include <algorithm>
#include <optional>
#include <system_error>

#include "gambit/log.hpp"

namespace gambit {

namespace {

constexpr std::string_view COMPONENT = "engine";

// Granularity at which a pending search checks for cancellation.
constexpr std::chrono::milliseconds POLL_SLICE{25};

} // namespace

std::string Engine::best_move(const std::string& fen, const std::vector<std::string>& moves,
                              const SearchLimits& limits, const CancelCheck& cancelled) {
  set_position(fen, moves);
  return search(limits, cancelled);
}

// ---------------------------------------------------------------------------
// UciEngine
// ---------------------------------------------------------------------------

UciEngine::UciEngine(UciEngineOptions options) : options_(std::move(options)) {
  if (options_.command.empty()) {
    throw Error(ErrorCode::EngineUnavailable, "no engine command configured");
  }

  name_ = options_.command.front();

  try {
    process_ = std::make_unique<Process>(options_.command);
  } catch (const std::system_error& ex) {
    throw Error(ErrorCode::EngineUnavailable,
                "could not start engine '" + name_ + "': " + ex.what());
  }

  const auto deadline = Process::Clock::now() + options_.handshake_timeout;

  send(uci::UCI);
  (void)await(uci::ReplyType::UciOk, deadline, "uciok");

  for (const auto& [option, value] : options_.options) {
    send(uci::setoption_command(option, value));
  }

  send(uci::IS_READY);
  (void)await(uci::ReplyType::ReadyOk, deadline, "readyok");

  log::info(COMPONENT, "started '" + name_ + "' (pid " + std::to_string(process_->pid()) + ")");
}

UciEngine::~UciEngine() {
  if (health_ == EngineHealth::Alive) {
    try {
      process_->write_line(uci::QUIT);
    } catch (const std::system_error& ex) {
      log::debug(COMPONENT, std::string("quit not delivered: ") + ex.what());
    }
  }
  process_->shutdown(options_.stop_grace);
}

void UciEngine::new_game() {
  send(uci::NEW_GAME);
  send(uci::IS_READY);
  (void)await(uci::ReplyType::ReadyOk, Process::Clock::now() + options_.handshake_timeout,
              "readyok");
}

void UciEngine::set_position(const std::string& fen, const std::vector<std::string>& moves) {
  send(uci::position_command(fen, moves));
}

std::string UciEngine::search(const SearchLimits& limits, const CancelCheck& cancelled) {
  send(uci::go_command(uci::GoParams{.depth = limits.depth}));

  const auto deadline = Process::Clock::now() + limits.timeout;
  std::optional<ErrorCode> abandoned{};
  Process::Clock::time_point stop_deadline{};
  std::string line;

  for (;;) {
    const auto now = Process::Clock::now();
    const auto slice_end = std::min(abandoned.has_value() ? stop_deadline : deadline,
                                    now + POLL_SLICE);

    Process::ReadStatus status = Process::ReadStatus::Timeout;
    try {
      status = process_->read_line(line, slice_end, MAX_LINE);
    } catch (const std::system_error& ex) {
      fail(ErrorCode::EngineUnavailable, std::string("read failed: ") + ex.what());
    }

    if (status == Process::ReadStatus::Eof) {
      fail(ErrorCode::EngineUnavailable, "engine exited during search");
    }

    if (status == Process::ReadStatus::Line) {
      if (line.size() >= MAX_LINE) {
        fail(ErrorCode::EngineProtocolError, "oversized line from engine");
      }

      const auto reply = uci::parse_reply(line);
      if (reply.type != uci::ReplyType::BestMove) {
        continue;
      }

      if (abandoned == ErrorCode::Cancelled) {
        throw Error(ErrorCode::Cancelled, "search cancelled");
      }
      if (abandoned == ErrorCode::EngineTimeout) {
        throw Error(ErrorCode::EngineTimeout, "engine did not answer within " +
                                                  std::to_string(limits.timeout.count()) +
                                                  " ms");
      }
      return reply.best_move->move;
    }

    const auto after = Process::Clock::now();

    if (abandoned.has_value()) {
      if (after >= stop_deadline) {
        process_->kill();
        fail(*abandoned, "engine ignored stop");
      }
      continue;
    }

    if (cancelled && cancelled()) {
      abandoned = ErrorCode::Cancelled;
    } else if (after >= deadline) {
      abandoned = ErrorCode::EngineTimeout;
    }

    if (abandoned.has_value()) {
      send(uci::STOP);
      stop_deadline = after + options_.stop_grace;
    }
  }
}

EngineHealth UciEngine::health() const {
  if (health_ == EngineHealth::Alive && !process_->running()) {
    health_ = EngineHealth::Crashed;
  }
  return health_;
}

void UciEngine::send(std::string_view line) {
  try {
    process_->write_line(line);
  } catch (const std::system_error& ex) {
    fail(ErrorCode::EngineUnavailable, std::string("write failed: ") + ex.what());
  }
}

uci::Reply UciEngine::await(uci::ReplyType type, Process::Clock::time_point deadline,
                            std::string_view waiting_for) {
  std::string line;
  for (;;) {
    Process::ReadStatus status = Process::ReadStatus::Timeout;
    try {
      status = process_->read_line(line, deadline, MAX_LINE);
    } catch (const std::system_error& ex) {
      fail(ErrorCode::EngineUnavailable, std::string("read failed: ") + ex.what());
    }

    switch (status) {
    case Process::ReadStatus::Eof:
      fail(ErrorCode::EngineUnavailable,
           "engine exited while waiting for " + std::string(waiting_for));
    case Process::ReadStatus::Timeout:
      fail(ErrorCode::EngineUnavailable, "timed out waiting for " + std::string(waiting_for));
    case Process::ReadStatus::Line:
      break;
    }

    auto reply = uci::parse_reply(line);
    if (reply.type == uci::ReplyType::IdName && !reply.text.empty()) {
      name_ = reply.text;
    }
    if (reply.type == type) {
      return reply;
    }
  }
}

void UciEngine::fail(ErrorCode code, const std::string& reason) {
  if (health_ == EngineHealth::Alive) {
    log::warning(COMPONENT, "'" + name_ + "' marked crashed: " + reason);
  }
  health_ = EngineHealth::Crashed;
  throw Error(code, reason);
}

} // namespace gambit
