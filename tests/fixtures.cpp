#include "fixtures.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

#include "gambit/rules.hpp"

namespace gambit::fixtures {

std::filesystem::path fixtures_root() {
#ifdef GAMBIT_FIXTURE_DIR
  return std::filesystem::path{GAMBIT_FIXTURE_DIR};
#else
  return std::filesystem::path{"tests/fixtures"};
#endif
}

std::filesystem::path fake_engine_path() {
  return fixtures_root() / "fake_uci_engine.sh";
}

std::vector<std::string> fake_engine_command(const std::string& mode) {
  return {"/bin/sh", fake_engine_path().string(), mode};
}

// -----------------------------------------------------------------------------
// StubBehaviour
// -----------------------------------------------------------------------------

void StubBehaviour::script(std::vector<std::string> replies) {
  std::scoped_lock lock(mutex_);
  replies_ = std::move(replies);
  next_ = 0;
}

std::optional<std::string> StubBehaviour::next_scripted() {
  std::scoped_lock lock(mutex_);
  if (next_ >= replies_.size()) {
    return std::nullopt;
  }
  return replies_[next_++];
}

// -----------------------------------------------------------------------------
// StubEngine
// -----------------------------------------------------------------------------

StubEngine::StubEngine(std::shared_ptr<StubBehaviour> behaviour)
    : behaviour_(std::move(behaviour)), board_(rules::board_from_fen(rules::START_POS_FEN)) {}

void StubEngine::set_position(const std::string& fen, const std::vector<std::string>& moves) {
  board_ = rules::board_from_fen(fen);
  for (const auto& uci : moves) {
    const auto mv = rules::find_legal_move(board_, uci);
    if (!mv.has_value()) {
      throw Error(ErrorCode::EngineProtocolError, "stub given illegal move " + uci);
    }
    board_.makeMove(*mv);
  }
}

std::string StubEngine::search(const SearchLimits& limits, const CancelCheck& cancelled) {
  ++behaviour_->searches;
  last_depth = limits.depth;

  const int now_in_flight = ++behaviour_->in_flight;
  int seen = behaviour_->max_in_flight.load();
  while (now_in_flight > seen &&
         !behaviour_->max_in_flight.compare_exchange_weak(seen, now_in_flight)) {
    // seen reloaded by the failed exchange
  }

  struct Leave {
    std::atomic<int>& counter;
    ~Leave() { --counter; }
  } leave{behaviour_->in_flight};

  const auto until = std::chrono::steady_clock::now() + behaviour_->delay;
  while (std::chrono::steady_clock::now() < until) {
    if (cancelled && cancelled()) {
      throw Error(ErrorCode::Cancelled, "search cancelled");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }

  if (behaviour_->fail_unexpectedly) {
    throw std::runtime_error("stub internal failure");
  }

  if (behaviour_->fail_with.has_value()) {
    if (*behaviour_->fail_with == ErrorCode::EngineUnavailable) {
      crash();
    }
    throw Error(*behaviour_->fail_with, "stub failure");
  }

  if (auto scripted = behaviour_->next_scripted()) {
    return *scripted;
  }

  const auto moves = rules::legal_uci_moves(board_);
  if (moves.empty()) {
    throw Error(ErrorCode::EngineProtocolError, "no legal move");
  }
  return moves.front();
}

EngineFactory stub_factory(std::shared_ptr<StubBehaviour> behaviour) {
  return [behaviour]() -> std::unique_ptr<Engine> {
    if (behaviour->refuse_spawn) {
      throw Error(ErrorCode::EngineUnavailable, "spawn refused");
    }
    if (behaviour->refuse_next > 0) {
      --behaviour->refuse_next;
      throw Error(ErrorCode::EngineUnavailable, "spawn refused");
    }
    ++behaviour->spawned;
    return std::make_unique<StubEngine>(behaviour);
  };
}

// -----------------------------------------------------------------------------
// TurnHolder
// -----------------------------------------------------------------------------

TurnHolder::TurnHolder(std::shared_ptr<Session> session)
    : thread_([this, session = std::move(session)] {
        const auto turn = session->begin_turn(BusyPolicy::Queue);
        std::unique_lock lock(mutex_);
        held_ = true;
        changed_.notify_all();
        changed_.wait(lock, [this] { return released_; });
      }) {
  std::unique_lock lock(mutex_);
  changed_.wait(lock, [this] { return held_; });
}

TurnHolder::~TurnHolder() {
  release();
}

void TurnHolder::release() {
  {
    std::scoped_lock lock(mutex_);
    released_ = true;
  }
  changed_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

} // namespace gambit::fixtures
