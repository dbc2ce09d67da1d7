#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gambit/error.hpp"
#include "gambit/process.hpp"
#include "gambit/uci.hpp"

namespace gambit {

enum class EngineHealth { Alive, Crashed };

// Polled while waiting on the engine. Returning true asks the engine to stop
// and the pending search to be abandoned.
using CancelCheck = std::function<bool()>;

struct SearchLimits {
  std::uint8_t depth{1};
  std::chrono::milliseconds timeout{5000};
};

// Capability interface for anything that can pick a move: a UCI subprocess in
// production, a stub in tests. Implementations are not thread-safe; the pool
// guarantees a single user at a time.
class Engine {
public:
  virtual ~Engine() = default;

  virtual void new_game() = 0;
  virtual void set_position(const std::string& fen, const std::vector<std::string>& moves) = 0;

  // Throws Error with EngineTimeout, EngineUnavailable, EngineProtocolError
  // or Cancelled.
  virtual std::string search(const SearchLimits& limits, const CancelCheck& cancelled) = 0;

  [[nodiscard]] virtual EngineHealth health() const = 0;
  [[nodiscard]] virtual std::string name() const = 0;

  std::string best_move(const std::string& fen, const std::vector<std::string>& moves,
                        const SearchLimits& limits, const CancelCheck& cancelled = {});
};

using EngineFactory = std::function<std::unique_ptr<Engine>()>;

struct UciEngineOptions {
  std::vector<std::string> command;
  std::chrono::milliseconds handshake_timeout{5000};
  // How long a stopped search may take to deliver its final bestmove.
  std::chrono::milliseconds stop_grace{500};
  std::vector<std::pair<std::string, std::string>> options{};
};

class UciEngine final : public Engine {
public:
  // Launches the engine and completes the uci/isready handshake. Throws
  // Error(EngineUnavailable) when either fails.
  explicit UciEngine(UciEngineOptions options);
  ~UciEngine() override;

  UciEngine(const UciEngine&) = delete;
  UciEngine& operator=(const UciEngine&) = delete;

  void new_game() override;
  void set_position(const std::string& fen, const std::vector<std::string>& moves) override;
  std::string search(const SearchLimits& limits, const CancelCheck& cancelled) override;

  [[nodiscard]] EngineHealth health() const override;
  [[nodiscard]] std::string name() const override { return name_; }

  [[nodiscard]] pid_t pid() const { return process_->pid(); }

  inline static constexpr std::size_t MAX_LINE = 16 * 1024;

private:
  void send(std::string_view line);
  uci::Reply await(uci::ReplyType type, Process::Clock::time_point deadline,
                   std::string_view waiting_for);
  // Marks the handle crashed and throws; the pool replaces it on release.
  [[noreturn]] void fail(ErrorCode code, const std::string& reason);

  UciEngineOptions options_;
  std::unique_ptr<Process> process_;
  std::string name_;
  mutable EngineHealth health_{EngineHealth::Alive};
};

} // namespace gambit
