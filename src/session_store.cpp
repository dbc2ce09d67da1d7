#include "gambit/session_store.hpp"

#include <array>
#include <cstdio>
#include <random>
#include <utility>

#include "gambit/error.hpp"
#include "gambit/log.hpp"

namespace gambit {

namespace {

constexpr std::string_view COMPONENT = "sessions";

// Ids are logged in shortened form only; the full token is the credential.
std::string short_id(const std::string& id) {
  return id.substr(0, 8);
}

} // namespace

std::string_view to_string(Phase phase) noexcept {
  switch (phase) {
  case Phase::AwaitingHumanMove:
    return "awaiting_human_move";
  case Phase::EngineTurn:
    return "engine_turn";
  case Phase::GameOver:
    return "game_over";
  }
  return "awaiting_human_move";
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

Session::Session(std::string id, SteadyClock::time_point now, std::uint8_t depth)
    : id_(std::move(id)), created_at_(now), last_active_at_(now), depth_(depth) {}

SteadyClock::time_point Session::last_active_at() const {
  std::scoped_lock lock(state_mutex_);
  return last_active_at_;
}

void Session::touch(SteadyClock::time_point now) {
  std::scoped_lock lock(state_mutex_);
  last_active_at_ = now;
}

std::unique_lock<std::mutex> Session::begin_turn(BusyPolicy policy) {
  if (policy == BusyPolicy::Queue) {
    return std::unique_lock(turn_mutex_);
  }

  std::unique_lock lock(turn_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    throw Error(ErrorCode::SessionBusy, "another request for this session is in progress");
  }
  return lock;
}

bool Session::turn_in_progress() {
  std::unique_lock lock(turn_mutex_, std::try_to_lock);
  return !lock.owns_lock();
}

SessionView Session::view() const {
  std::scoped_lock lock(state_mutex_);
  return SessionView{.state = state_, .phase = phase_, .depth = depth_};
}

void Session::publish(GameState state, Phase phase) {
  std::scoped_lock lock(state_mutex_);
  state_ = std::move(state);
  phase_ = phase;
}

void Session::set_phase(Phase phase) {
  std::scoped_lock lock(state_mutex_);
  phase_ = phase;
}

void Session::set_depth(std::uint8_t depth) {
  std::scoped_lock lock(state_mutex_);
  depth_ = depth;
}

// ---------------------------------------------------------------------------
// SessionStore
// ---------------------------------------------------------------------------

SessionStore::SessionStore(SessionStoreOptions options) : options_(std::move(options)) {}

std::shared_ptr<Session> SessionStore::create(std::uint8_t depth) {
  const auto now = options_.clock();

  std::scoped_lock lock(mutex_);
  std::string id = generate_id();
  while (sessions_.contains(id)) {
    id = generate_id();
  }

  auto session = std::make_shared<Session>(id, now, depth);
  sessions_.emplace(id, session);
  log::info(COMPONENT, "created " + short_id(id) + " (" + std::to_string(sessions_.size()) +
                           " active)");
  return session;
}

std::shared_ptr<Session> SessionStore::get(const std::string& id) {
  const auto now = options_.clock();

  std::scoped_lock lock(mutex_);
  const auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    throw Error(ErrorCode::SessionNotFound, "Session not found");
  }

  auto session = it->second;
  if (now - session->last_active_at() > options_.ttl && !session->turn_in_progress()) {
    sessions_.erase(it);
    log::info(COMPONENT, "expired " + short_id(id) + " on access");
    throw Error(ErrorCode::SessionNotFound, "Session not found");
  }

  return session;
}

void SessionStore::touch(const std::string& id) {
  const auto now = options_.clock();

  std::scoped_lock lock(mutex_);
  const auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    throw Error(ErrorCode::SessionNotFound, "Session not found");
  }
  it->second->touch(now);
}

void SessionStore::remove(const std::string& id) {
  const auto now = options_.clock();

  std::scoped_lock lock(mutex_);
  const auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    throw Error(ErrorCode::SessionNotFound, "Session not found");
  }

  const auto lifetime =
      std::chrono::duration_cast<std::chrono::seconds>(now - it->second->created_at());
  sessions_.erase(it);
  log::info(COMPONENT,
            "ended " + short_id(id) + " after " + std::to_string(lifetime.count()) + "s");
}

std::size_t SessionStore::evict_idle(std::chrono::seconds ttl) {
  const auto now = options_.clock();
  std::size_t evicted = 0;

  std::scoped_lock lock(mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    const auto& session = it->second;
    if (now - session->last_active_at() > ttl && !session->turn_in_progress()) {
      it = sessions_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }

  if (evicted > 0) {
    log::info(COMPONENT, "evicted " + std::to_string(evicted) + " idle sessions (" +
                             std::to_string(sessions_.size()) + " active)");
  }
  return evicted;
}

std::size_t SessionStore::size() const {
  std::scoped_lock lock(mutex_);
  return sessions_.size();
}

std::string SessionStore::generate_id() {
  thread_local std::random_device device;

  std::array<std::uint32_t, 4> words{};
  for (auto& word : words) {
    word = device();
  }

  std::string id;
  id.reserve(32);
  for (const auto word : words) {
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", word);
    id += buffer;
  }
  return id;
}

// ---------------------------------------------------------------------------
// IdleReaper
// ---------------------------------------------------------------------------

IdleReaper::IdleReaper(SessionStore& store, std::chrono::milliseconds interval)
    : store_(store), interval_(interval), thread_([this] { run(); }) {}

IdleReaper::~IdleReaper() {
  stop();
}

void IdleReaper::stop() {
  {
    std::scoped_lock lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void IdleReaper::run() {
  std::unique_lock lock(mutex_);
  while (!wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
    lock.unlock();
    (void)store_.evict_idle();
    lock.lock();
  }
}

} // namespace gambit
