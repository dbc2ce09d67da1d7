#include "gambit/error.hpp"

namespace gambit {

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::BadRequest:
    return "BadRequest";
  case ErrorCode::InvalidMove:
    return "InvalidMove";
  case ErrorCode::NothingToUndo:
    return "NothingToUndo";
  case ErrorCode::GameOver:
    return "GameOver";
  case ErrorCode::SessionNotFound:
    return "SessionNotFound";
  case ErrorCode::SessionBusy:
    return "SessionBusy";
  case ErrorCode::EngineTimeout:
    return "EngineTimeout";
  case ErrorCode::EngineUnavailable:
    return "EngineUnavailable";
  case ErrorCode::EngineProtocolError:
    return "EngineProtocolError";
  case ErrorCode::PoolTimeout:
    return "PoolTimeout";
  case ErrorCode::EnginePoolDegraded:
    return "EnginePoolDegraded";
  case ErrorCode::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

ErrorClass error_class(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::InvalidMove:
  case ErrorCode::NothingToUndo:
    return ErrorClass::User;
  case ErrorCode::BadRequest:
  case ErrorCode::GameOver:
  case ErrorCode::SessionNotFound:
  case ErrorCode::SessionBusy:
  case ErrorCode::Cancelled:
    return ErrorClass::Client;
  case ErrorCode::EngineTimeout:
  case ErrorCode::EngineUnavailable:
  case ErrorCode::EngineProtocolError:
  case ErrorCode::PoolTimeout:
    return ErrorClass::Infrastructure;
  case ErrorCode::EnginePoolDegraded:
    return ErrorClass::Fatal;
  }
  return ErrorClass::Infrastructure;
}

} // namespace gambit
