#include "gambit/rules.hpp"

#include <algorithm>

namespace gambit::rules {

namespace {

bool is_file(char c) {
  return c >= 'a' && c <= 'h';
}

bool is_rank(char c) {
  return c >= '1' && c <= '8';
}

} // namespace

std::string_view to_string(Outcome outcome) noexcept {
  switch (outcome) {
  case Outcome::Ongoing:
    return "ongoing";
  case Outcome::Checkmate:
    return "checkmate";
  case Outcome::Stalemate:
    return "stalemate";
  case Outcome::InsufficientMaterial:
    return "insufficient material";
  case Outcome::FiftyMoveRule:
    return "fifty-move rule";
  case Outcome::ThreefoldRepetition:
    return "threefold repetition";
  }
  return "ongoing";
}

bool is_uci_syntax(std::string_view uci) noexcept {
  if (uci.size() != 4 && uci.size() != 5) {
    return false;
  }

  if (!is_file(uci[0]) || !is_rank(uci[1]) || !is_file(uci[2]) || !is_rank(uci[3])) {
    return false;
  }

  if (uci.size() == 5) {
    const char promo = uci[4];
    return promo == 'q' || promo == 'r' || promo == 'b' || promo == 'n';
  }

  return true;
}

chess::Board board_from_fen(std::string_view fen) {
  return chess::Board(std::string(fen));
}

std::vector<chess::Move> legal_moves(const chess::Board& board) {
  chess::Movelist moves;
  chess::movegen::legalmoves(moves, board);
  return std::vector<chess::Move>(moves.begin(), moves.end());
}

std::vector<std::string> legal_uci_moves(const chess::Board& board) {
  std::vector<std::string> out;
  for (const auto& mv : legal_moves(board)) {
    out.push_back(to_uci(mv));
  }
  std::ranges::sort(out);
  return out;
}

std::optional<chess::Move> find_legal_move(const chess::Board& board, std::string_view uci) {
  if (!is_uci_syntax(uci)) {
    return std::nullopt;
  }

  for (const auto& mv : legal_moves(board)) {
    if (to_uci(mv) == uci) {
      return mv;
    }
  }

  return std::nullopt;
}

Outcome outcome(const chess::Board& board) {
  const auto [reason, result] = board.isGameOver();
  (void)result;

  switch (reason) {
  case chess::GameResultReason::CHECKMATE:
    return Outcome::Checkmate;
  case chess::GameResultReason::STALEMATE:
    return Outcome::Stalemate;
  case chess::GameResultReason::INSUFFICIENT_MATERIAL:
    return Outcome::InsufficientMaterial;
  case chess::GameResultReason::FIFTY_MOVE_RULE:
    return Outcome::FiftyMoveRule;
  case chess::GameResultReason::THREEFOLD_REPETITION:
    return Outcome::ThreefoldRepetition;
  case chess::GameResultReason::NONE:
    return Outcome::Ongoing;
  }
  return Outcome::Ongoing;
}

Colour side_to_move(const chess::Board& board) {
  return board.sideToMove() == chess::Color::WHITE ? Colour::White : Colour::Black;
}

bool in_check(const chess::Board& board) {
  return board.inCheck();
}

std::string to_uci(const chess::Move& move) {
  return chess::uci::moveToUci(move);
}

std::string to_san(const chess::Board& board, const chess::Move& move) {
  return chess::uci::moveToSan(board, move);
}

} // namespace gambit::rules
