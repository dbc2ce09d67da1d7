#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace gambit {

enum class ErrorCode {
  BadRequest,
  InvalidMove,
  NothingToUndo,
  GameOver,
  SessionNotFound,
  SessionBusy,
  EngineTimeout,
  EngineUnavailable,
  EngineProtocolError,
  PoolTimeout,
  EnginePoolDegraded,
  Cancelled,
};

// Who can fix the failure: the player (User), the API caller (Client), a
// retry or the pool healing itself (Infrastructure), or an operator (Fatal).
enum class ErrorClass { User, Client, Infrastructure, Fatal };

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string& message);

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;
[[nodiscard]] ErrorClass error_class(ErrorCode code) noexcept;

} // namespace gambit
