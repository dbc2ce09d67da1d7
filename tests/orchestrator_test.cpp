#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fixtures.hpp"
#include "gambit/error.hpp"
#include "gambit/orchestrator.hpp"

using namespace gambit;
using namespace std::chrono_literals;
using fixtures::StubBehaviour;

namespace {

ErrorCode error_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error& ex) {
    return ex.code();
  }
  ADD_FAILURE() << "expected gambit::Error";
  return ErrorCode::BadRequest;
}

// A pool of stub engines, a store and the orchestrator under test.
struct Service {
  explicit Service(EnginePoolOptions pool_options = {.size = 2},
                   OrchestratorOptions options = {})
      : behaviour(std::make_shared<StubBehaviour>()),
        pool(fixtures::stub_factory(behaviour), pool_options),
        orchestrator(store, pool, options) {}

  std::shared_ptr<StubBehaviour> behaviour;
  EnginePool pool;
  SessionStore store;
  Orchestrator orchestrator;
};

} // namespace

// -----------------------------------------------------------------------------
// Game lifecycle
// -----------------------------------------------------------------------------

TEST(Orchestrator, NewGameStartsFromInitialPosition) {
  Service service;
  const auto snapshot = service.orchestrator.new_game();

  EXPECT_FALSE(snapshot.session_id.empty());
  EXPECT_EQ(snapshot.state.fen(), rules::START_POS_FEN);
  EXPECT_EQ(snapshot.phase, Phase::AwaitingHumanMove);
  EXPECT_EQ(snapshot.depth, 1);
  EXPECT_EQ(service.store.size(), 1u);
}

TEST(Orchestrator, NewGameClampsDifficulty) {
  Service service;
  EXPECT_EQ(service.orchestrator.new_game(std::nullopt, 7).depth, 7);
  EXPECT_EQ(service.orchestrator.new_game(std::nullopt, 0).depth, MIN_DEPTH);
  EXPECT_EQ(service.orchestrator.new_game(std::nullopt, 99).depth, MAX_DEPTH);
}

TEST(Orchestrator, NewGameWithKnownIdResetsSession) {
  Service service;
  const auto id = service.orchestrator.new_game(std::nullopt, 5).session_id;
  ASSERT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);

  const auto reset = service.orchestrator.new_game(id);
  EXPECT_EQ(reset.session_id, id);
  EXPECT_EQ(reset.state.move_count(), 0u);
  EXPECT_EQ(reset.depth, 5);
  EXPECT_EQ(service.store.size(), 1u);
}

TEST(Orchestrator, NewGameWithUnknownIdCreatesSession) {
  Service service;
  const auto snapshot = service.orchestrator.new_game(std::string("not-a-session"));
  EXPECT_NE(snapshot.session_id, "not-a-session");
  EXPECT_EQ(service.store.size(), 1u);
}

TEST(Orchestrator, EndGameRemovesSession) {
  Service service;
  const auto id = service.orchestrator.new_game().session_id;
  service.orchestrator.end_game(id);

  EXPECT_EQ(error_of([&] { (void)service.orchestrator.status(id); }),
            ErrorCode::SessionNotFound);
  EXPECT_EQ(error_of([&] { service.orchestrator.end_game(id); }), ErrorCode::SessionNotFound);
}

// -----------------------------------------------------------------------------
// Moves
// -----------------------------------------------------------------------------

TEST(Orchestrator, HumanMoveGetsEngineReply) {
  Service service;
  const auto id = service.orchestrator.new_game().session_id;

  const auto result = service.orchestrator.submit_move(id, "e2e4");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.engine_move, "a7a5");
  EXPECT_EQ(result.snapshot.state.status(), GameStatus::Ongoing);
  EXPECT_EQ(result.snapshot.phase, Phase::AwaitingHumanMove);
  EXPECT_EQ(result.snapshot.state.uci_moves(), (std::vector<std::string>{"e2e4", "a7a5"}));
  EXPECT_EQ(result.snapshot.state.history()[1].player, Player::Engine);

  const auto status = service.orchestrator.status(id);
  EXPECT_EQ(status.state.fen(), result.snapshot.state.fen());
}

TEST(Orchestrator, IllegalMoveIsReportedNotThrown) {
  Service service;
  const auto id = service.orchestrator.new_game().session_id;

  const auto result = service.orchestrator.submit_move(id, "e2e5");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "Invalid move");
  EXPECT_EQ(result.snapshot.state.fen(), rules::START_POS_FEN);
  EXPECT_EQ(service.orchestrator.status(id).state.move_count(), 0u);
  EXPECT_EQ(service.behaviour->searches.load(), 0);
}

TEST(Orchestrator, SearchUsesSessionDepth) {
  Service service(EnginePoolOptions{.size = 1});
  const auto id = service.orchestrator.new_game(std::nullopt, 4).session_id;
  EXPECT_EQ(service.orchestrator.set_difficulty(id, 9), 9);

  ASSERT_TRUE(service.orchestrator.submit_move(id, "d2d4").success);

  auto lease = service.pool.acquire();
  EXPECT_EQ(dynamic_cast<fixtures::StubEngine&>(*lease).last_depth.load(), 9);
}

TEST(Orchestrator, EngineCanDeliverMate) {
  Service service;
  service.behaviour->script({"e7e5", "d8h4"});
  const auto id = service.orchestrator.new_game().session_id;

  ASSERT_TRUE(service.orchestrator.submit_move(id, "f2f3").success);
  const auto result = service.orchestrator.submit_move(id, "g2g4");

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.engine_move, "d8h4");
  EXPECT_EQ(result.snapshot.state.status(), GameStatus::Checkmate);
  EXPECT_EQ(result.snapshot.phase, Phase::GameOver);
  EXPECT_EQ(result.snapshot.state.result(), "0-1");

  const auto after = service.orchestrator.submit_move(id, "a2a3");
  EXPECT_FALSE(after.success);
  EXPECT_EQ(after.error, "Game is over");
}

TEST(Orchestrator, HumanMateSkipsEngine) {
  Service service;
  service.behaviour->script({"e7e5", "b8c6", "g8f6"});
  const auto id = service.orchestrator.new_game().session_id;

  for (const char* uci : {"e2e4", "f1c4", "d1h5"}) {
    ASSERT_TRUE(service.orchestrator.submit_move(id, uci).success) << uci;
  }
  const int searches = service.behaviour->searches.load();

  const auto result = service.orchestrator.submit_move(id, "h5f7");
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.engine_move.has_value());
  EXPECT_EQ(result.snapshot.state.status(), GameStatus::Checkmate);
  EXPECT_EQ(result.snapshot.state.result(), "1-0");
  EXPECT_EQ(service.behaviour->searches.load(), searches);
}

// -----------------------------------------------------------------------------
// Failures leave the session untouched
// -----------------------------------------------------------------------------

TEST(Orchestrator, EngineTimeoutKeepsPublishedState) {
  Service service;
  const auto id = service.orchestrator.new_game().session_id;
  ASSERT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);
  const auto before = service.orchestrator.status(id);

  service.behaviour->fail_with = ErrorCode::EngineTimeout;
  EXPECT_EQ(error_of([&] { (void)service.orchestrator.submit_move(id, "d2d4"); }),
            ErrorCode::EngineTimeout);

  const auto after = service.orchestrator.status(id);
  EXPECT_EQ(after.state.fen(), before.state.fen());
  EXPECT_EQ(after.state.uci_moves(), before.state.uci_moves());
  EXPECT_EQ(after.phase, Phase::AwaitingHumanMove);
}

TEST(Orchestrator, UnexpectedEngineFailureRestoresPhase) {
  Service service;
  const auto id = service.orchestrator.new_game().session_id;

  service.behaviour->fail_unexpectedly = true;
  EXPECT_THROW((void)service.orchestrator.submit_move(id, "e2e4"), std::runtime_error);

  const auto after = service.orchestrator.status(id);
  EXPECT_EQ(after.phase, Phase::AwaitingHumanMove);
  EXPECT_EQ(after.state.move_count(), 0u);

  service.behaviour->fail_unexpectedly = false;
  EXPECT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);
}

TEST(Orchestrator, CrashedEngineSurfacesAndIsReplaced) {
  Service service(EnginePoolOptions{.size = 1});
  const auto id = service.orchestrator.new_game().session_id;

  service.behaviour->fail_with = ErrorCode::EngineUnavailable;
  EXPECT_EQ(error_of([&] { (void)service.orchestrator.submit_move(id, "e2e4"); }),
            ErrorCode::EngineUnavailable);
  EXPECT_EQ(service.orchestrator.status(id).state.move_count(), 0u);
  EXPECT_EQ(service.pool.stats().crashed, 1u);

  service.behaviour->fail_with.reset();
  EXPECT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);
  EXPECT_EQ(service.behaviour->spawned.load(), 2);
}

TEST(Orchestrator, IllegalEngineReplyIsProtocolError) {
  Service service;
  service.behaviour->script({"e2e4"});
  const auto id = service.orchestrator.new_game().session_id;

  EXPECT_EQ(error_of([&] { (void)service.orchestrator.submit_move(id, "d2d4"); }),
            ErrorCode::EngineProtocolError);
  EXPECT_EQ(service.orchestrator.status(id).state.move_count(), 0u);
}

TEST(Orchestrator, CancelledMoveKeepsPublishedState) {
  Service service;
  service.behaviour->delay = 500ms;
  const auto id = service.orchestrator.new_game().session_id;

  const CancelCheck hung_up = [] { return true; };
  EXPECT_EQ(error_of([&] { (void)service.orchestrator.submit_move(id, "e2e4", hung_up); }),
            ErrorCode::Cancelled);
  EXPECT_EQ(service.orchestrator.status(id).state.move_count(), 0u);
}

TEST(Orchestrator, DegradedPoolRefusesNewGamesButServesStatus) {
  Service service(EnginePoolOptions{.size = 1, .max_spawn_failures = 1});
  const auto id = service.orchestrator.new_game().session_id;

  {
    auto lease = service.pool.acquire();
    service.behaviour->refuse_spawn = true;
    dynamic_cast<fixtures::StubEngine&>(*lease).crash();
  }
  ASSERT_TRUE(service.pool.degraded());

  EXPECT_EQ(error_of([&] { (void)service.orchestrator.new_game(); }),
            ErrorCode::EnginePoolDegraded);
  EXPECT_EQ(error_of([&] { (void)service.orchestrator.submit_move(id, "e2e4"); }),
            ErrorCode::EnginePoolDegraded);
  EXPECT_EQ(service.orchestrator.status(id).state.move_count(), 0u);

  service.behaviour->refuse_spawn = false;
  service.pool.reset();
  EXPECT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);
}

// -----------------------------------------------------------------------------
// Undo, resign, PGN
// -----------------------------------------------------------------------------

TEST(Orchestrator, UndoTakesBackFullMove) {
  Service service;
  const auto id = service.orchestrator.new_game().session_id;
  ASSERT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);
  const auto after_first = service.orchestrator.status(id).state.fen();
  ASSERT_TRUE(service.orchestrator.submit_move(id, "d2d4").success);

  const auto undone = service.orchestrator.undo(id);
  EXPECT_EQ(undone.state.fen(), after_first);
  EXPECT_EQ(undone.state.move_count(), 2u);
  EXPECT_EQ(undone.state.side_to_move(), Colour::White);

  EXPECT_EQ(service.orchestrator.undo(id).state.fen(), rules::START_POS_FEN);
  EXPECT_EQ(error_of([&] { (void)service.orchestrator.undo(id); }), ErrorCode::NothingToUndo);
}

TEST(Orchestrator, UndoAfterHumanMateTakesOneMove) {
  Service service;
  service.behaviour->script({"e7e5", "b8c6", "g8f6"});
  const auto id = service.orchestrator.new_game().session_id;
  for (const char* uci : {"e2e4", "f1c4", "d1h5", "h5f7"}) {
    ASSERT_TRUE(service.orchestrator.submit_move(id, uci).success) << uci;
  }

  const auto undone = service.orchestrator.undo(id);
  EXPECT_EQ(undone.state.move_count(), 6u);
  EXPECT_EQ(undone.state.status(), GameStatus::Ongoing);
  EXPECT_EQ(undone.phase, Phase::AwaitingHumanMove);
}

TEST(Orchestrator, ResignEndsGame) {
  Service service;
  const auto id = service.orchestrator.new_game().session_id;
  ASSERT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);

  const auto resigned = service.orchestrator.resign(id);
  EXPECT_EQ(resigned.state.status(), GameStatus::Resigned);
  EXPECT_EQ(resigned.phase, Phase::GameOver);
  EXPECT_EQ(resigned.state.result(), "0-1");

  EXPECT_EQ(error_of([&] { (void)service.orchestrator.resign(id); }), ErrorCode::GameOver);
  EXPECT_EQ(error_of([&] { (void)service.orchestrator.undo(id); }), ErrorCode::GameOver);
  EXPECT_FALSE(service.orchestrator.submit_move(id, "d2d4").success);
}

TEST(Orchestrator, PgnNamesEngineDepth) {
  Service service;
  const auto id = service.orchestrator.new_game(std::nullopt, 6).session_id;
  ASSERT_TRUE(service.orchestrator.submit_move(id, "e2e4").success);

  const auto pgn = service.orchestrator.pgn(id);
  EXPECT_NE(pgn.find("[Site \"gambit\"]"), std::string::npos);
  EXPECT_NE(pgn.find("[Black \"Engine (depth 6)\"]"), std::string::npos);
  EXPECT_NE(pgn.find("1. e4 a5 *"), std::string::npos) << pgn;
}

// -----------------------------------------------------------------------------
// Concurrency
// -----------------------------------------------------------------------------

TEST(OrchestratorConcurrency, SameSessionSubmissionsDoNotBothApply) {
  Service service;
  service.behaviour->delay = 100ms;
  const auto id = service.orchestrator.new_game().session_id;

  std::atomic<int> succeeded{0};
  std::atomic<int> busy{0};
  std::vector<std::thread> players;
  for (const char* uci : {"e2e4", "d2d4"}) {
    players.emplace_back([&, uci] {
      try {
        if (service.orchestrator.submit_move(id, uci).success) {
          ++succeeded;
        }
      } catch (const Error& ex) {
        if (ex.code() == ErrorCode::SessionBusy) {
          ++busy;
        }
      }
    });
  }
  for (auto& player : players) {
    player.join();
  }

  const auto state = service.orchestrator.status(id).state;
  EXPECT_EQ(succeeded.load() + busy.load(), 2);
  EXPECT_GE(succeeded.load(), 1);
  EXPECT_EQ(state.move_count(), static_cast<std::size_t>(2 * succeeded.load()));
  EXPECT_EQ(GameState::replay(state.uci_moves()).fen(), state.fen());
}

TEST(OrchestratorConcurrency, QueuedSubmissionsAreSerialized) {
  Service service(EnginePoolOptions{.size = 2},
                  OrchestratorOptions{.busy_policy = BusyPolicy::Queue});
  service.behaviour->delay = 50ms;
  const auto id = service.orchestrator.new_game().session_id;

  std::atomic<int> succeeded{0};
  std::vector<std::thread> players;
  for (const char* uci : {"e2e4", "d2d4"}) {
    players.emplace_back([&, uci] {
      if (service.orchestrator.submit_move(id, uci).success) {
        ++succeeded;
      }
    });
  }
  for (auto& player : players) {
    player.join();
  }

  EXPECT_EQ(succeeded.load(), 2);
  EXPECT_EQ(service.orchestrator.status(id).state.move_count(), 4u);
  EXPECT_EQ(service.behaviour->max_in_flight.load(), 1);
}

TEST(OrchestratorConcurrency, StatusIsNotBlockedByEngine) {
  Service service;
  service.behaviour->delay = 300ms;
  const auto id = service.orchestrator.new_game().session_id;

  std::thread player([&] { (void)service.orchestrator.submit_move(id, "e2e4"); });
  std::this_thread::sleep_for(50ms);

  const auto start = std::chrono::steady_clock::now();
  const auto snapshot = service.orchestrator.status(id);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
  EXPECT_EQ(snapshot.phase, Phase::EngineTurn);
  EXPECT_EQ(snapshot.state.move_count(), 0u);

  player.join();
}

TEST(OrchestratorConcurrency, SingleEngineSharedBySessions) {
  Service service(EnginePoolOptions{.size = 1, .acquire_timeout = 2000ms});
  service.behaviour->delay = 50ms;
  const auto a = service.orchestrator.new_game().session_id;
  const auto b = service.orchestrator.new_game().session_id;

  std::atomic<int> succeeded{0};
  std::thread first([&] { succeeded += service.orchestrator.submit_move(a, "e2e4").success; });
  std::thread second([&] { succeeded += service.orchestrator.submit_move(b, "e2e4").success; });
  first.join();
  second.join();

  EXPECT_EQ(succeeded.load(), 2);
  EXPECT_EQ(service.behaviour->max_in_flight.load(), 1);
}

TEST(OrchestratorConcurrency, ExhaustedPoolTimesOutWithoutDeadlock) {
  Service service(EnginePoolOptions{.size = 1, .acquire_timeout = 20ms});
  service.behaviour->delay = 200ms;
  const auto a = service.orchestrator.new_game().session_id;
  const auto b = service.orchestrator.new_game().session_id;

  std::atomic<int> succeeded{0};
  std::atomic<int> timed_out{0};
  auto play = [&](const std::string& id) {
    try {
      succeeded += service.orchestrator.submit_move(id, "e2e4").success;
    } catch (const Error& ex) {
      if (ex.code() == ErrorCode::PoolTimeout) {
        ++timed_out;
      }
    }
  };

  std::thread first(play, a);
  std::thread second(play, b);
  first.join();
  second.join();

  EXPECT_EQ(succeeded.load() + timed_out.load(), 2);
  EXPECT_GE(succeeded.load(), 1);

  // A timed-out session is left as it was and can play on.
  for (const auto& id : {a, b}) {
    const auto state = service.orchestrator.status(id).state;
    EXPECT_TRUE(state.move_count() == 0 || state.move_count() == 2);
  }
}
