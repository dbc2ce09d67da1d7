#include "gambit/orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "gambit/about.hpp"
#include "gambit/error.hpp"
#include "gambit/log.hpp"

namespace gambit {

namespace {

constexpr std::string_view COMPONENT = "orchestrator";

// The human always plays White.
constexpr Colour HUMAN = Colour::White;

Phase phase_after_turn(const GameState& state) {
  return state.is_over() ? Phase::GameOver : Phase::AwaitingHumanMove;
}

Snapshot make_snapshot(const Session& session, SessionView view) {
  return Snapshot{
      .session_id = session.id(),
      .state = std::move(view.state),
      .phase = view.phase,
      .depth = view.depth,
  };
}

} // namespace

std::uint8_t clamp_depth(long long level) noexcept {
  return static_cast<std::uint8_t>(std::clamp<long long>(level, MIN_DEPTH, MAX_DEPTH));
}

Orchestrator::Orchestrator(SessionStore& sessions, EnginePool& engines,
                           OrchestratorOptions options)
    : sessions_(sessions), engines_(engines), options_(options) {
  options_.default_depth = clamp_depth(options_.default_depth);
}

Snapshot Orchestrator::new_game(const std::optional<std::string>& reset_id,
                                std::optional<long long> difficulty) {
  if (engines_.degraded()) {
    throw Error(ErrorCode::EnginePoolDegraded, "engine pool is degraded, new games are refused");
  }

  const std::uint8_t depth =
      difficulty.has_value() ? clamp_depth(*difficulty) : options_.default_depth;

  std::shared_ptr<Session> session;
  if (reset_id.has_value()) {
    try {
      session = resolve(*reset_id);
    } catch (const Error& ex) {
      if (ex.code() != ErrorCode::SessionNotFound) {
        throw;
      }
    }
  }

  if (!session) {
    session = sessions_.create(depth);
    return make_snapshot(*session, session->view());
  }

  const auto turn = session->begin_turn(options_.busy_policy);
  session->publish(GameState{}, Phase::AwaitingHumanMove);
  if (difficulty.has_value()) {
    session->set_depth(depth);
  }
  return make_snapshot(*session, session->view());
}

MoveResult Orchestrator::submit_move(const std::string& id, const std::string& uci,
                                     const CancelCheck& cancelled) {
  const auto session = resolve(id);
  const auto turn = session->begin_turn(options_.busy_policy);
  const auto view = session->view();

  GameState next = view.state;
  try {
    next.apply_move(uci, Player::Human);
  } catch (const Error& ex) {
    if (ex.code() != ErrorCode::InvalidMove) {
      throw;
    }
    return MoveResult{
        .success = false,
        .error = ex.what(),
        .snapshot = make_snapshot(*session, view),
    };
  }

  std::optional<std::string> reply;
  if (!next.is_over()) {
    session->set_phase(Phase::EngineTurn);
    try {
      reply = request_engine_move(next, view.depth, cancelled);
      next.apply_move(*reply, Player::Engine);
    } catch (const Error& ex) {
      session->set_phase(view.phase);
      if (ex.code() == ErrorCode::InvalidMove) {
        throw Error(ErrorCode::EngineProtocolError, "engine played illegal move " + reply.value_or("?"));
      }
      throw;
    } catch (const std::exception&) {
      session->set_phase(view.phase);
      throw;
    }
  }

  const Phase phase = phase_after_turn(next);
  session->publish(next, phase);

  return MoveResult{
      .success = true,
      .engine_move = reply,
      .snapshot =
          Snapshot{
              .session_id = session->id(),
              .state = std::move(next),
              .phase = phase,
              .depth = view.depth,
          },
  };
}

Snapshot Orchestrator::status(const std::string& id) {
  const auto session = resolve(id);
  return make_snapshot(*session, session->view());
}

std::string Orchestrator::pgn(const std::string& id) {
  const auto session = resolve(id);
  const auto view = session->view();

  PgnTags tags;
  tags.site = service_name();
  tags.black = "Engine (depth " + std::to_string(view.depth) + ")";
  return view.state.to_pgn(tags);
}

Snapshot Orchestrator::undo(const std::string& id) {
  const auto session = resolve(id);
  const auto turn = session->begin_turn(options_.busy_policy);
  auto view = session->view();

  if (view.state.status() == GameStatus::Resigned) {
    throw Error(ErrorCode::GameOver, "Game is over");
  }
  if (view.state.history().empty()) {
    throw Error(ErrorCode::NothingToUndo, "Nothing to undo");
  }

  GameState next = view.state;
  const Player last = next.history().back().player;
  next.undo();
  if (last == Player::Engine && !next.history().empty()) {
    next.undo();
  }

  const Phase phase = phase_after_turn(next);
  session->publish(next, phase);
  view.state = std::move(next);
  view.phase = phase;
  return make_snapshot(*session, std::move(view));
}

Snapshot Orchestrator::resign(const std::string& id) {
  const auto session = resolve(id);
  const auto turn = session->begin_turn(options_.busy_policy);
  auto view = session->view();

  GameState next = view.state;
  next.resign(HUMAN);

  session->publish(next, Phase::GameOver);
  view.state = std::move(next);
  view.phase = Phase::GameOver;
  return make_snapshot(*session, std::move(view));
}

std::uint8_t Orchestrator::set_difficulty(const std::string& id, long long level) {
  const auto session = resolve(id);
  const auto depth = clamp_depth(level);
  session->set_depth(depth);
  return depth;
}

void Orchestrator::end_game(const std::string& id) {
  sessions_.remove(id);
}

std::shared_ptr<Session> Orchestrator::resolve(const std::string& id) {
  auto session = sessions_.get(id);
  sessions_.touch(id);
  return session;
}

std::string Orchestrator::request_engine_move(const GameState& state, std::uint8_t depth,
                                              const CancelCheck& cancelled) {
  auto engine = engines_.acquire();
  try {
    engine->new_game();
    return engine->best_move(state.start_fen(), state.uci_moves(),
                             SearchLimits{.depth = depth, .timeout = options_.engine_timeout},
                             cancelled);
  } catch (const Error& ex) {
    log::warning(COMPONENT, std::string(to_string(ex.code())) + " from '" + engine->name() +
                                "': " + ex.what());
    throw;
  }
}

} // namespace gambit
