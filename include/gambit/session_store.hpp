#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "gambit/game_state.hpp"

namespace gambit {

using SteadyClock = std::chrono::steady_clock;

enum class Phase { AwaitingHumanMove, EngineTurn, GameOver };

[[nodiscard]] std::string_view to_string(Phase phase) noexcept;

// What to do with a second request for a session that is mid-turn.
enum class BusyPolicy { Reject, Queue };

struct SessionView {
  GameState state;
  Phase phase{Phase::AwaitingHumanMove};
  std::uint8_t depth{1};
};

// One player's game. Two locks:
//   - the turn lock serializes writers for the whole request, engine time
//     included;
//   - the state lock guards the published GameState and is only held for
//     copies, so readers never wait behind the engine.
class Session {
public:
  Session(std::string id, SteadyClock::time_point now, std::uint8_t depth);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  [[nodiscard]] const std::string& id() const { return id_; }
  [[nodiscard]] SteadyClock::time_point created_at() const { return created_at_; }
  [[nodiscard]] SteadyClock::time_point last_active_at() const;
  void touch(SteadyClock::time_point now);

  // Throws Error(SessionBusy) under BusyPolicy::Reject when another request
  // holds the turn.
  [[nodiscard]] std::unique_lock<std::mutex> begin_turn(BusyPolicy policy);
  [[nodiscard]] bool turn_in_progress();

  [[nodiscard]] SessionView view() const;
  void publish(GameState state, Phase phase);
  void set_phase(Phase phase);
  void set_depth(std::uint8_t depth);

private:
  const std::string id_;
  const SteadyClock::time_point created_at_;

  std::mutex turn_mutex_;

  mutable std::mutex state_mutex_;
  SteadyClock::time_point last_active_at_;
  GameState state_;
  Phase phase_{Phase::AwaitingHumanMove};
  std::uint8_t depth_;
};

struct SessionStoreOptions {
  std::chrono::seconds ttl{1800};
  std::function<SteadyClock::time_point()> clock{[] { return SteadyClock::now(); }};
};

class SessionStore {
public:
  explicit SessionStore(SessionStoreOptions options = {});

  std::shared_ptr<Session> create(std::uint8_t depth);

  // Throws Error(SessionNotFound) for unknown ids and for sessions idle past
  // the TTL, which are dropped on the spot.
  std::shared_ptr<Session> get(const std::string& id);

  // Marks the session active now. Throws Error(SessionNotFound) for unknown
  // ids; never expires.
  void touch(const std::string& id);

  void remove(const std::string& id);

  // Drops sessions idle longer than `ttl`, skipping any with a request in
  // flight. Returns how many were dropped.
  std::size_t evict_idle(std::chrono::seconds ttl);
  std::size_t evict_idle() { return evict_idle(options_.ttl); }

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::chrono::seconds ttl() const { return options_.ttl; }
  [[nodiscard]] SteadyClock::time_point now() const { return options_.clock(); }

private:
  static std::string generate_id();

  SessionStoreOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

// Runs SessionStore::evict_idle() on a background thread every `interval`
// until destroyed.
class IdleReaper {
public:
  IdleReaper(SessionStore& store, std::chrono::milliseconds interval);
  ~IdleReaper();

  IdleReaper(const IdleReaper&) = delete;
  IdleReaper& operator=(const IdleReaper&) = delete;

  void stop();

private:
  void run();

  SessionStore& store_;
  std::chrono::milliseconds interval_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{false};
  std::thread thread_;
};

} // namespace gambit
