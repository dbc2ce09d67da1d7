#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chess.hpp>

#include "gambit/colour.hpp"
#include "gambit/rules.hpp"

namespace gambit {

enum class GameStatus { Ongoing, Checkmate, Stalemate, Draw, Resigned };

enum class Player { Human, Engine };

[[nodiscard]] std::string_view to_string(GameStatus status) noexcept;
[[nodiscard]] std::string_view to_string(Player player) noexcept;

struct MoveRecord {
  std::string uci;
  std::string san;
  Player player{Player::Human};
  std::chrono::system_clock::time_point played_at{};
};

struct PgnTags {
  std::string event{"Casual game"};
  std::string site{"?"};
  std::string round{"-"};
  std::string white{"Human"};
  std::string black{"Engine"};
};

// A single game: the board, the moves that produced it and the derived
// status. The board is always the replay of `history()` from the start
// position; every mutation either fully succeeds or leaves the state as it
// was.
class GameState {
public:
  GameState();

  // Rebuild a game from UCI moves, throwing InvalidMove on the first move
  // that is not legal.
  static GameState replay(const std::vector<std::string>& uci_moves);

  [[nodiscard]] std::string fen() const;
  [[nodiscard]] const std::string& start_fen() const { return start_fen_; }
  [[nodiscard]] Colour side_to_move() const { return rules::side_to_move(board_); }
  [[nodiscard]] bool in_check() const { return rules::in_check(board_); }
  [[nodiscard]] std::vector<std::string> legal_moves() const;

  [[nodiscard]] const std::vector<MoveRecord>& history() const { return history_; }
  [[nodiscard]] std::vector<std::string> uci_moves() const;
  [[nodiscard]] std::size_t move_count() const { return history_.size(); }

  [[nodiscard]] GameStatus status() const { return status_; }
  [[nodiscard]] rules::Outcome outcome() const { return outcome_; }
  [[nodiscard]] bool is_over() const { return status_ != GameStatus::Ongoing; }
  [[nodiscard]] std::optional<Colour> winner() const;
  [[nodiscard]] std::string result() const;

  [[nodiscard]] std::chrono::system_clock::time_point started_at() const { return started_at_; }

  // Throws Error(InvalidMove) for malformed or illegal moves and for any move
  // once the game is over.
  void apply_move(std::string_view uci, Player player);

  // Throws Error(NothingToUndo) on an empty history. Clears a resignation.
  void undo();

  void resign(Colour side);

  [[nodiscard]] std::string to_pgn(const PgnTags& tags = {}) const;

private:
  void refresh_status();

  std::string start_fen_;
  chess::Board board_;
  std::vector<MoveRecord> history_;
  GameStatus status_{GameStatus::Ongoing};
  rules::Outcome outcome_{rules::Outcome::Ongoing};
  std::optional<Colour> resigned_{};
  std::chrono::system_clock::time_point started_at_;
};

} // namespace gambit
