#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gambit::uci {

// ---------------------------------------------------------------------------
// Engine -> service
// ---------------------------------------------------------------------------

enum class ReplyType { IdName, IdAuthor, Option, UciOk, ReadyOk, Info, BestMove, Unknown };

struct BestMove {
  std::string move;

  friend bool operator==(const BestMove&, const BestMove&) = default;
};

struct Reply {
  ReplyType type{ReplyType::Unknown};
  std::string text{}; // remainder after the keyword(s)
  std::optional<BestMove> best_move{};
};

// Classifies one line of engine output. Throws Error(EngineProtocolError)
// for a `bestmove` line without a well-formed move, including
// "bestmove (none)".
Reply parse_reply(const std::string& line);

// ---------------------------------------------------------------------------
// Service -> engine
// ---------------------------------------------------------------------------

struct GoParams {
  std::optional<std::uint8_t> depth{};
};

[[nodiscard]] std::string position_command(std::string_view fen,
                                           const std::vector<std::string>& moves);
[[nodiscard]] std::string go_command(const GoParams& params);
[[nodiscard]] std::string setoption_command(std::string_view name,
                                            std::optional<std::string_view> value);

inline constexpr std::string_view UCI = "uci";
inline constexpr std::string_view IS_READY = "isready";
inline constexpr std::string_view NEW_GAME = "ucinewgame";
inline constexpr std::string_view STOP = "stop";
inline constexpr std::string_view QUIT = "quit";

} // namespace gambit::uci
