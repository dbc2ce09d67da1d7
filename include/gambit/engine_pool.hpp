#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "gambit/engine.hpp"

namespace gambit {

struct EnginePoolOptions {
  std::size_t size{1};
  std::chrono::milliseconds acquire_timeout{2000};
  // Consecutive failed spawns after which the pool refuses service until
  // reset().
  std::size_t max_spawn_failures{3};
  // Pause between consecutive spawn attempts.
  std::chrono::milliseconds spawn_retry_delay{100};
};

struct PoolStats {
  std::size_t size{0};
  std::size_t idle{0};
  std::size_t busy{0};
  std::size_t vacant{0};
  bool degraded{false};
  std::uint64_t spawned{0};
  std::uint64_t crashed{0};
};

class EnginePool;

// Exclusive use of one pooled engine. Returns it to the pool on destruction.
class EngineLease {
public:
  EngineLease() = default;
  EngineLease(EnginePool& pool, std::unique_ptr<Engine> engine);
  ~EngineLease();

  EngineLease(const EngineLease&) = delete;
  EngineLease& operator=(const EngineLease&) = delete;
  EngineLease(EngineLease&& other) noexcept;
  EngineLease& operator=(EngineLease&& other) noexcept;

  Engine& operator*() const { return *engine_; }
  Engine* operator->() const { return engine_.get(); }
  [[nodiscard]] Engine* get() const { return engine_.get(); }
  explicit operator bool() const { return engine_ != nullptr; }

  void release();

private:
  EnginePool* pool_{nullptr};
  std::unique_ptr<Engine> engine_;
};

// Fixed-size set of engines shared by all sessions. Every slot is either
// idle, lent out (busy), or vacant after a failed respawn. Engines that come
// back crashed are replaced; enough consecutive spawn failures put the pool
// into a degraded state that only reset() clears.
//
// All leases must be returned before the pool is destroyed.
class EnginePool {
public:
  // Spawns `options.size` engines up front.
  EnginePool(EngineFactory factory, EnginePoolOptions options);
  ~EnginePool() = default;

  EnginePool(const EnginePool&) = delete;
  EnginePool& operator=(const EnginePool&) = delete;

  // Throws Error(PoolTimeout) when nothing frees up within the configured
  // wait and Error(EnginePoolDegraded) while degraded.
  EngineLease acquire();
  EngineLease acquire(std::chrono::milliseconds timeout);

  void release(std::unique_ptr<Engine> engine) noexcept;

  // Clears the degraded state and respawns vacant slots. Returns how many
  // engines were started.
  std::size_t reset();

  [[nodiscard]] bool degraded() const;
  [[nodiscard]] PoolStats stats() const;
  [[nodiscard]] std::size_t size() const { return options_.size; }

private:
  std::unique_ptr<Engine> try_spawn() noexcept;
  std::size_t fill_vacant();

  EngineFactory factory_;
  EnginePoolOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<Engine>> idle_;
  std::size_t busy_{0};
  std::size_t vacant_{0};
  std::size_t consecutive_failures_{0};
  bool degraded_{false};
  std::uint64_t spawned_{0};
  std::uint64_t crashed_{0};
};

} // namespace gambit
