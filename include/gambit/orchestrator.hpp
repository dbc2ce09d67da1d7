#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "gambit/engine.hpp"
#include "gambit/engine_pool.hpp"
#include "gambit/game_state.hpp"
#include "gambit/session_store.hpp"

namespace gambit {

inline constexpr int MIN_DEPTH = 1;
inline constexpr int MAX_DEPTH = 20;

[[nodiscard]] std::uint8_t clamp_depth(long long level) noexcept;

struct OrchestratorOptions {
  std::uint8_t default_depth{1};
  std::chrono::milliseconds engine_timeout{5000};
  BusyPolicy busy_policy{BusyPolicy::Reject};
};

struct Snapshot {
  std::string session_id;
  GameState state;
  Phase phase{Phase::AwaitingHumanMove};
  std::uint8_t depth{1};
};

struct MoveResult {
  bool success{false};
  std::string error{};
  std::optional<std::string> engine_move{};
  Snapshot snapshot;
};

// Drives each session through AwaitingHumanMove -> EngineTurn ->
// AwaitingHumanMove until GameOver. A turn works on a private copy of the
// game and publishes it only once the human move and the engine reply have
// both been applied, so a failure anywhere leaves the session untouched.
class Orchestrator {
public:
  Orchestrator(SessionStore& sessions, EnginePool& engines, OrchestratorOptions options);

  // Resets `reset_id` when it names a live session, otherwise starts a new
  // one. Refused with EnginePoolDegraded while the pool is degraded.
  Snapshot new_game(const std::optional<std::string>& reset_id = std::nullopt,
                    std::optional<long long> difficulty = std::nullopt);

  // An illegal move is a normal outcome (success == false); infrastructure
  // failures are thrown as Error.
  MoveResult submit_move(const std::string& id, const std::string& uci,
                         const CancelCheck& cancelled = {});

  Snapshot status(const std::string& id);
  std::string pgn(const std::string& id);

  // Takes back the last full move so that it is the human's turn again.
  Snapshot undo(const std::string& id);
  Snapshot resign(const std::string& id);
  std::uint8_t set_difficulty(const std::string& id, long long level);
  void end_game(const std::string& id);

private:
  std::shared_ptr<Session> resolve(const std::string& id);
  std::string request_engine_move(const GameState& state, std::uint8_t depth,
                                  const CancelCheck& cancelled);

  SessionStore& sessions_;
  EnginePool& engines_;
  OrchestratorOptions options_;
};

} // namespace gambit
