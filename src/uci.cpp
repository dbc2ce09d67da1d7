#include "gambit/uci.hpp"

#include <sstream>

#include "gambit/error.hpp"
#include "gambit/rules.hpp"

namespace gambit::uci {

namespace {

std::vector<std::string> split_tokens(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> parts;
  std::string token;
  while (iss >> token) {
    parts.push_back(token);
  }
  return parts;
}

std::string join(std::vector<std::string>::const_iterator first,
                 std::vector<std::string>::const_iterator last) {
  std::string out;
  for (auto it = first; it != last; ++it) {
    out += (it == first ? "" : " ") + *it;
  }
  return out;
}

BestMove parse_best_move(const std::vector<std::string>& parts) {
  if (parts.size() < 2) {
    throw Error(ErrorCode::EngineProtocolError, "bestmove without a move");
  }

  const std::string& move = parts[1];
  if (move == "(none)" || move == "0000") {
    throw Error(ErrorCode::EngineProtocolError, "engine reported no move");
  }
  if (!rules::is_uci_syntax(move)) {
    throw Error(ErrorCode::EngineProtocolError, "malformed bestmove '" + move + "'");
  }

  return BestMove{.move = move};
}

} // namespace

Reply parse_reply(const std::string& line) {
  const std::vector<std::string> parts = split_tokens(line);
  if (parts.empty()) {
    return Reply{};
  }

  const std::string& head = parts[0];
  Reply reply{};

  if (head == "id" && parts.size() >= 2 && (parts[1] == "name" || parts[1] == "author")) {
    reply.type = parts[1] == "name" ? ReplyType::IdName : ReplyType::IdAuthor;
    reply.text = join(parts.begin() + 2, parts.end());
  } else if (head == "option") {
    reply.type = ReplyType::Option;
    reply.text = join(parts.begin() + 1, parts.end());
  } else if (head == "uciok") {
    reply.type = ReplyType::UciOk;
  } else if (head == "readyok") {
    reply.type = ReplyType::ReadyOk;
  } else if (head == "info") {
    reply.type = ReplyType::Info;
    reply.text = join(parts.begin() + 1, parts.end());
  } else if (head == "bestmove") {
    reply.type = ReplyType::BestMove;
    reply.best_move = parse_best_move(parts);
  } else {
    reply.text = line;
  }

  return reply;
}

std::string position_command(std::string_view fen, const std::vector<std::string>& moves) {
  std::string out = "position ";

  if (fen == rules::START_POS_FEN) {
    out += "startpos";
  } else {
    out += "fen ";
    out += fen;
  }

  if (!moves.empty()) {
    out += " moves";
    for (const auto& mv : moves) {
      out += ' ';
      out += mv;
    }
  }

  return out;
}

std::string go_command(const GoParams& params) {
  std::string out = "go";

  if (params.depth.has_value()) {
    out += " depth " + std::to_string(*params.depth);
  }

  return out;
}

std::string setoption_command(std::string_view name, std::optional<std::string_view> value) {
  std::string out = "setoption name ";
  out += name;

  if (value.has_value()) {
    out += " value ";
    out += *value;
  }

  return out;
}

} // namespace gambit::uci
