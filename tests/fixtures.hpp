#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <chess.hpp>

#include "gambit/engine.hpp"
#include "gambit/error.hpp"
#include "gambit/session_store.hpp"

namespace gambit::fixtures {

std::filesystem::path fixtures_root();
std::filesystem::path fake_engine_path();

// Command line for the scripted engine in the given mode (see the script for
// the list of modes).
std::vector<std::string> fake_engine_command(const std::string& mode);

// Shared knobs and counters for every StubEngine made by one factory.
struct StubBehaviour {
  std::chrono::milliseconds delay{0};
  std::optional<ErrorCode> fail_with{};
  // Throws std::runtime_error from search, outside the Error hierarchy.
  std::atomic_bool fail_unexpectedly{false};
  std::atomic_bool refuse_spawn{false};
  // Spawns to refuse before succeeding again.
  std::atomic<int> refuse_next{0};

  std::atomic<int> spawned{0};
  std::atomic<int> searches{0};
  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};

  // Replies handed out in order before falling back to the first legal move.
  void script(std::vector<std::string> replies);
  std::optional<std::string> next_scripted();

private:
  std::mutex mutex_;
  std::vector<std::string> replies_;
  std::size_t next_{0};
};

// In-process engine that plays the alphabetically first legal move.
class StubEngine final : public Engine {
public:
  explicit StubEngine(std::shared_ptr<StubBehaviour> behaviour);

  void new_game() override {}
  void set_position(const std::string& fen, const std::vector<std::string>& moves) override;
  std::string search(const SearchLimits& limits, const CancelCheck& cancelled) override;

  [[nodiscard]] EngineHealth health() const override { return health_; }
  [[nodiscard]] std::string name() const override { return "stub"; }

  void crash() { health_ = EngineHealth::Crashed; }

  // Number of leases currently holding this engine.
  std::atomic<int> holders{0};
  std::atomic<int> last_depth{0};

private:
  std::shared_ptr<StubBehaviour> behaviour_;
  chess::Board board_;
  EngineHealth health_{EngineHealth::Alive};
};

EngineFactory stub_factory(std::shared_ptr<StubBehaviour> behaviour);

// Holds a session's turn lock from another thread until released, standing in
// for a request that is mid-turn.
class TurnHolder {
public:
  explicit TurnHolder(std::shared_ptr<Session> session);
  ~TurnHolder();

  TurnHolder(const TurnHolder&) = delete;
  TurnHolder& operator=(const TurnHolder&) = delete;

  void release();

private:
  std::mutex mutex_;
  std::condition_variable changed_;
  bool held_{false};
  bool released_{false};
  std::thread thread_;
};

} // namespace gambit::fixtures
