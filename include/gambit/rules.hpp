#pragma once

// Adapter over the chess rules library (chess.hpp). Everything the service
// knows about legality, game termination and SAN goes through here.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chess.hpp>

#include "gambit/colour.hpp"

namespace gambit::rules {

inline constexpr std::string_view START_POS_FEN =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

enum class Outcome {
  Ongoing,
  Checkmate,
  Stalemate,
  InsufficientMaterial,
  FiftyMoveRule,
  ThreefoldRepetition,
};

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;
[[nodiscard]] constexpr bool is_draw(Outcome outcome) noexcept {
  return outcome == Outcome::Stalemate || outcome == Outcome::InsufficientMaterial ||
         outcome == Outcome::FiftyMoveRule || outcome == Outcome::ThreefoldRepetition;
}

// Purely syntactic: "e2e4", "e7e8q". Says nothing about legality.
[[nodiscard]] bool is_uci_syntax(std::string_view uci) noexcept;

[[nodiscard]] chess::Board board_from_fen(std::string_view fen);

[[nodiscard]] std::vector<chess::Move> legal_moves(const chess::Board& board);
[[nodiscard]] std::vector<std::string> legal_uci_moves(const chess::Board& board);

// Returns the legal move spelled by `uci`, or nullopt when the text is
// malformed or names a move that is not legal in `board`.
[[nodiscard]] std::optional<chess::Move> find_legal_move(const chess::Board& board,
                                                         std::string_view uci);

[[nodiscard]] Outcome outcome(const chess::Board& board);
[[nodiscard]] Colour side_to_move(const chess::Board& board);
[[nodiscard]] bool in_check(const chess::Board& board);

[[nodiscard]] std::string to_uci(const chess::Move& move);
[[nodiscard]] std::string to_san(const chess::Board& board, const chess::Move& move);

} // namespace gambit::rules
