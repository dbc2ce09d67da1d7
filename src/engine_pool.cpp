#include "gambit/engine_pool.hpp"

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include "gambit/error.hpp"
#include "gambit/log.hpp"

namespace gambit {

namespace {

constexpr std::string_view COMPONENT = "pool";

} // namespace

// ---------------------------------------------------------------------------
// EngineLease
// ---------------------------------------------------------------------------

EngineLease::EngineLease(EnginePool& pool, std::unique_ptr<Engine> engine)
    : pool_(&pool), engine_(std::move(engine)) {}

EngineLease::~EngineLease() {
  release();
}

EngineLease::EngineLease(EngineLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)), engine_(std::move(other.engine_)) {}

EngineLease& EngineLease::operator=(EngineLease&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = std::exchange(other.pool_, nullptr);
    engine_ = std::move(other.engine_);
  }
  return *this;
}

void EngineLease::release() {
  if (pool_ != nullptr && engine_) {
    pool_->release(std::move(engine_));
  }
  pool_ = nullptr;
}

// ---------------------------------------------------------------------------
// EnginePool
// ---------------------------------------------------------------------------

EnginePool::EnginePool(EngineFactory factory, EnginePoolOptions options)
    : factory_(std::move(factory)), options_(options) {
  if (options_.size == 0) {
    options_.size = 1;
  }
  if (options_.max_spawn_failures == 0) {
    options_.max_spawn_failures = 1;
  }

  vacant_ = options_.size;
  const auto started = fill_vacant();
  log::info(COMPONENT, "started " + std::to_string(started) + " of " +
                           std::to_string(options_.size) + " engines");
}

EngineLease EnginePool::acquire() {
  return acquire(options_.acquire_timeout);
}

EngineLease EnginePool::acquire(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lock(mutex_);

  for (;;) {
    if (degraded_) {
      throw Error(ErrorCode::EnginePoolDegraded, "engine pool is degraded");
    }

    if (!idle_.empty()) {
      auto engine = std::move(idle_.back());
      idle_.pop_back();
      ++busy_;

      if (engine->health() == EngineHealth::Alive) {
        return EngineLease(*this, std::move(engine));
      }

      // Died while idle: replace it before handing anything out.
      ++crashed_;
      lock.unlock();
      log::warning(COMPONENT, "idle engine '" + engine->name() + "' found dead, replacing");
      engine.reset();
      auto fresh = try_spawn();
      lock.lock();

      if (fresh) {
        return EngineLease(*this, std::move(fresh));
      }
      --busy_;
      ++vacant_;
      available_.notify_all();
      continue;
    }

    if (vacant_ > 0) {
      --vacant_;
      ++busy_;
      lock.unlock();
      auto fresh = try_spawn();
      lock.lock();

      if (fresh) {
        return EngineLease(*this, std::move(fresh));
      }
      --busy_;
      ++vacant_;
      available_.notify_all();
      continue;
    }

    const bool ready = available_.wait_until(
        lock, deadline, [this] { return degraded_ || !idle_.empty() || vacant_ > 0; });
    if (!ready) {
      throw Error(ErrorCode::PoolTimeout, "no engine available within " +
                                              std::to_string(timeout.count()) + " ms");
    }
  }
}

void EnginePool::release(std::unique_ptr<Engine> engine) noexcept {
  if (!engine) {
    return;
  }

  if (engine->health() == EngineHealth::Alive) {
    std::scoped_lock lock(mutex_);
    --busy_;
    idle_.push_back(std::move(engine));
    available_.notify_one();
    return;
  }

  log::warning(COMPONENT, "engine '" + engine->name() + "' returned crashed, replacing");
  {
    std::scoped_lock lock(mutex_);
    ++crashed_;
  }
  engine.reset();

  auto fresh = try_spawn();

  std::scoped_lock lock(mutex_);
  --busy_;
  if (fresh) {
    idle_.push_back(std::move(fresh));
  } else {
    ++vacant_;
  }
  available_.notify_all();
}

std::size_t EnginePool::reset() {
  {
    std::scoped_lock lock(mutex_);
    degraded_ = false;
    consecutive_failures_ = 0;
  }

  const auto started = fill_vacant();
  log::info(COMPONENT, "reset, started " + std::to_string(started) + " engines");
  return started;
}

bool EnginePool::degraded() const {
  std::scoped_lock lock(mutex_);
  return degraded_;
}

PoolStats EnginePool::stats() const {
  std::scoped_lock lock(mutex_);
  return PoolStats{
      .size = options_.size,
      .idle = idle_.size(),
      .busy = busy_,
      .vacant = vacant_,
      .degraded = degraded_,
      .spawned = spawned_,
      .crashed = crashed_,
  };
}

std::unique_ptr<Engine> EnginePool::try_spawn() noexcept {
  for (;;) {
    {
      std::scoped_lock lock(mutex_);
      if (degraded_) {
        return nullptr;
      }
    }

    std::string failure;
    try {
      auto engine = factory_();
      if (engine) {
        std::scoped_lock lock(mutex_);
        consecutive_failures_ = 0;
        ++spawned_;
        return engine;
      }
      failure = "factory returned no engine";
    } catch (const std::exception& ex) {
      failure = ex.what();
    }

    {
      std::scoped_lock lock(mutex_);
      ++consecutive_failures_;
      log::warning(COMPONENT, "engine spawn failed (" + std::to_string(consecutive_failures_) +
                                  "/" + std::to_string(options_.max_spawn_failures) +
                                  "): " + failure);

      if (consecutive_failures_ >= options_.max_spawn_failures) {
        degraded_ = true;
        log::error(COMPONENT, "engine pool degraded; new games are refused until reset");
        available_.notify_all();
        return nullptr;
      }
    }

    std::this_thread::sleep_for(options_.spawn_retry_delay);
  }
}

std::size_t EnginePool::fill_vacant() {
  std::size_t to_start = 0;
  {
    std::scoped_lock lock(mutex_);
    to_start = vacant_;
    vacant_ = 0;
    busy_ += to_start;
  }

  std::size_t started = 0;
  for (std::size_t i = 0; i < to_start; ++i) {
    auto fresh = try_spawn();

    std::scoped_lock lock(mutex_);
    --busy_;
    if (fresh) {
      idle_.push_back(std::move(fresh));
      ++started;
    } else {
      ++vacant_;
    }
    available_.notify_one();
  }

  return started;
}

} // namespace gambit
