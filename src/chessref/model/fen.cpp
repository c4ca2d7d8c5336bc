#include "chessref/model/fen.hpp"

#include <cctype>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "chessref/model/move_validator.hpp"

namespace chessref::model::fen {

namespace {

std::vector<std::string> splitFields(const std::string &fen) {
  std::istringstream ss(fen);
  std::vector<std::string> fields;
  std::string f;
  while (ss >> f) fields.push_back(f);
  return fields;
}

std::optional<core::PieceType> charToPiece(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'k':
      return core::PieceType::King;
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    case 'p':
      return core::PieceType::Pawn;
    default:
      return std::nullopt;
  }
}

void setErr(std::string *err, const std::string &msg) {
  if (err) *err = msg;
}

std::string rankLabel(int rank) { return "rank " + std::to_string(rank + 1) + ": "; }

// Reads the placement field into `out`, rank 8 first. On failure names the offending
// rank in `err`.
bool readPlacement(const std::string &placement, Board &out, std::string *err) {
  out.clear();
  int rank = core::BOARD_SIZE - 1;
  int file = 0;

  for (std::size_t i = 0; i <= placement.size(); ++i) {
    const bool endOfRank = (i == placement.size() || placement[i] == '/');
    if (endOfRank) {
      if (rank < 0) {
        setErr(err, "too many ranks");
        return false;
      }
      if (file != core::BOARD_SIZE) {
        setErr(err, rankLabel(rank) + "expected 8 squares, got " +
                        std::to_string(file));
        return false;
      }
      --rank;
      file = 0;
      continue;
    }

    const char ch = placement[i];
    if (rank < 0) {
      setErr(err, "too many ranks");
      return false;
    }
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      const int n = ch - '0';
      if (n < 1 || n > core::BOARD_SIZE) {
        setErr(err, rankLabel(rank) + "bad empty count '" + ch + "'");
        return false;
      }
      file += n;
    } else {
      const auto type = charToPiece(ch);
      if (!type) {
        setErr(err, rankLabel(rank) + "unknown piece '" + ch + "'");
        return false;
      }
      if (file < core::BOARD_SIZE) {
        const core::Color color = std::isupper(static_cast<unsigned char>(ch))
                                      ? core::Color::White
                                      : core::Color::Black;
        out.setPiece(core::Square{file, rank}, core::Piece{*type, color});
      }
      ++file;
    }
    if (file > core::BOARD_SIZE) {
      setErr(err, rankLabel(rank) + "more than 8 squares");
      return false;
    }
  }

  if (rank != -1) {
    setErr(err, "expected 8 ranks, got " + std::to_string(core::BOARD_SIZE - 1 - rank));
    return false;
  }
  return true;
}

int countKings(const Board &board, core::Color c) {
  int n = 0;
  for (int rank = 0; rank < core::BOARD_SIZE; ++rank)
    for (int file = 0; file < core::BOARD_SIZE; ++file) {
      const auto p = board.at(core::Square{file, rank});
      if (p && p->type == core::PieceType::King && p->color == c) ++n;
    }
  return n;
}

// Placement and side to move; everything after them is ignored.
bool readFields(const std::string &fen, GameState &st, std::string *err) {
  const auto fields = splitFields(fen);
  if (fields.size() < 2) {
    setErr(err, "malformed FEN: expected placement and side to move: " + fen);
    return false;
  }
  std::string why;
  if (!readPlacement(fields[0], st.board, &why)) {
    setErr(err, "malformed FEN: " + why + ": " + fen);
    return false;
  }
  if (fields[1] != "w" && fields[1] != "b") {
    setErr(err, "malformed FEN: side to move must be 'w' or 'b': " + fen);
    return false;
  }
  st.sideToMove = (fields[1] == "w") ? core::Color::White : core::Color::Black;
  return true;
}

}  // namespace

bool isFenWellFormed(const std::string &fen) {
  GameState st;
  return readFields(fen, st, nullptr);
}

std::optional<GameState> parseFen(const std::string &fen, std::string *err) {
  GameState st;
  if (!readFields(fen, st, err)) return std::nullopt;

  if (countKings(st.board, core::Color::White) != 1 ||
      countKings(st.board, core::Color::Black) != 1) {
    setErr(err, "position must contain exactly one king per side");
    return std::nullopt;
  }
  // the side that just moved may not have left its king attacked
  if (isInCheck(st.board, ~st.sideToMove)) {
    setErr(err, "side not to move is in check");
    return std::nullopt;
  }
  return st;
}

}  // namespace chessref::model::fen
