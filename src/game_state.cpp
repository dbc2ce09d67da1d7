#include "gambit/game_state.hpp"

#include <ctime>
#include <iterator>
#include <sstream>
#include <utility>

#include "gambit/error.hpp"

namespace gambit {

namespace {

constexpr std::size_t PGN_LINE_WIDTH = 80;

std::string pgn_date(std::chrono::system_clock::time_point tp) {
  const auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buffer[16];
  const auto len = std::strftime(buffer, sizeof(buffer), "%Y.%m.%d", &tm);
  return std::string(buffer, len);
}

std::string escape_tag(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

chess::Board replay_board(const std::string& start_fen, const std::vector<MoveRecord>& history) {
  chess::Board board = rules::board_from_fen(start_fen);

  for (const auto& record : history) {
    const auto mv = rules::find_legal_move(board, record.uci);
    if (!mv.has_value()) {
      throw Error(ErrorCode::InvalidMove, "history contains illegal move " + record.uci);
    }
    board.makeMove(*mv);
  }

  return board;
}

void write_tag(std::ostringstream& out, std::string_view name, const std::string& value) {
  out << '[' << name << " \"" << escape_tag(value) << "\"]\n";
}

} // namespace

std::string_view to_string(GameStatus status) noexcept {
  switch (status) {
  case GameStatus::Ongoing:
    return "ongoing";
  case GameStatus::Checkmate:
    return "checkmate";
  case GameStatus::Stalemate:
    return "stalemate";
  case GameStatus::Draw:
    return "draw";
  case GameStatus::Resigned:
    return "resigned";
  }
  return "ongoing";
}

std::string_view to_string(Player player) noexcept {
  return player == Player::Human ? "human" : "ai";
}

GameState::GameState()
    : start_fen_(rules::START_POS_FEN), board_(rules::board_from_fen(start_fen_)),
      started_at_(std::chrono::system_clock::now()) {}

GameState GameState::replay(const std::vector<std::string>& uci_moves) {
  GameState state;
  Player player = Player::Human;
  for (const auto& uci : uci_moves) {
    state.apply_move(uci, player);
    player = player == Player::Human ? Player::Engine : Player::Human;
  }
  return state;
}

std::string GameState::fen() const {
  return board_.getFen();
}

std::vector<std::string> GameState::legal_moves() const {
  if (is_over()) {
    return {};
  }
  return rules::legal_uci_moves(board_);
}

std::vector<std::string> GameState::uci_moves() const {
  std::vector<std::string> moves;
  moves.reserve(history_.size());
  for (const auto& record : history_) {
    moves.push_back(record.uci);
  }
  return moves;
}

std::optional<Colour> GameState::winner() const {
  switch (status_) {
  case GameStatus::Checkmate:
    // The side to move is the one that has been mated.
    return !side_to_move();
  case GameStatus::Resigned:
    return !resigned_.value_or(Colour::White);
  case GameStatus::Ongoing:
  case GameStatus::Stalemate:
  case GameStatus::Draw:
    return std::nullopt;
  }
  return std::nullopt;
}

std::string GameState::result() const {
  if (status_ == GameStatus::Ongoing) {
    return "*";
  }

  const auto side = winner();
  if (!side.has_value()) {
    return "1/2-1/2";
  }

  return *side == Colour::White ? "1-0" : "0-1";
}

void GameState::apply_move(std::string_view uci, Player player) {
  if (is_over()) {
    throw Error(ErrorCode::InvalidMove, "Game is over");
  }

  const auto mv = rules::find_legal_move(board_, uci);
  if (!mv.has_value()) {
    throw Error(ErrorCode::InvalidMove, "Invalid move");
  }

  MoveRecord record{
      .uci = std::string(uci),
      .san = rules::to_san(board_, *mv),
      .player = player,
      .played_at = std::chrono::system_clock::now(),
  };

  board_.makeMove(*mv);
  history_.push_back(std::move(record));
  refresh_status();
}

void GameState::undo() {
  if (history_.empty()) {
    throw Error(ErrorCode::NothingToUndo, "Nothing to undo");
  }

  std::vector<MoveRecord> remaining(history_.begin(), std::prev(history_.end()));
  board_ = replay_board(start_fen_, remaining);
  history_ = std::move(remaining);
  resigned_.reset();
  refresh_status();
}

void GameState::resign(Colour side) {
  if (is_over()) {
    throw Error(ErrorCode::GameOver, "Game is over");
  }

  resigned_ = side;
  status_ = GameStatus::Resigned;
}

void GameState::refresh_status() {
  if (resigned_.has_value()) {
    status_ = GameStatus::Resigned;
    return;
  }

  outcome_ = rules::outcome(board_);

  if (outcome_ == rules::Outcome::Ongoing) {
    status_ = GameStatus::Ongoing;
  } else if (outcome_ == rules::Outcome::Checkmate) {
    status_ = GameStatus::Checkmate;
  } else if (outcome_ == rules::Outcome::Stalemate) {
    status_ = GameStatus::Stalemate;
  } else {
    status_ = GameStatus::Draw;
  }
}

std::string GameState::to_pgn(const PgnTags& tags) const {
  std::ostringstream out;

  write_tag(out, "Event", tags.event);
  write_tag(out, "Site", tags.site);
  write_tag(out, "Date", pgn_date(started_at_));
  write_tag(out, "Round", tags.round);
  write_tag(out, "White", tags.white);
  write_tag(out, "Black", tags.black);
  write_tag(out, "Result", result());

  if (status_ == GameStatus::Resigned) {
    write_tag(out, "Termination", std::string(to_string(*resigned_)) + " resigns");
  } else if (is_over()) {
    write_tag(out, "Termination", std::string(rules::to_string(outcome_)));
  }
  out << '\n';

  std::vector<std::string> tokens;
  tokens.reserve(history_.size() + history_.size() / 2 + 1);
  for (std::size_t ply = 0; ply < history_.size(); ++ply) {
    if (ply % 2 == 0) {
      tokens.push_back(std::to_string(ply / 2 + 1) + ".");
    }
    tokens.push_back(history_[ply].san);
  }
  tokens.push_back(result());

  std::size_t column = 0;
  for (const auto& token : tokens) {
    if (column > 0 && column + 1 + token.size() > PGN_LINE_WIDTH) {
      out << '\n';
      column = 0;
    } else if (column > 0) {
      out << ' ';
      ++column;
    }
    out << token;
    column += token.size();
  }
  out << '\n';

  return out.str();
}

} // namespace gambit
