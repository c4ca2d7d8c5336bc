#include "chessref/model/notation.hpp"

#include <cctype>

namespace chessref::model::notation {

namespace {
const std::string kFilesRow = "      a     b     c     d     e     f     g     h  ";

std::string separatorRow() {
  std::string s = "   +";
  for (int i = 0; i < core::BOARD_SIZE; ++i) s += "-----+";
  return s;
}

// right aligned, two columns
std::string rankLabel(int rank) {
  std::string s = std::to_string(rank + 1);
  if (s.size() < 2) s.insert(0, 1, ' ');
  return s;
}
}  // namespace

std::string toNotation(core::Square sq) {
  std::string s;
  s.push_back(static_cast<char>('a' + sq.file));
  s += std::to_string(sq.rank + 1);
  return s;
}

char pieceSymbol(const core::Piece& p) noexcept {
  char c = ' ';
  switch (p.type) {
    case core::PieceType::King:
      c = 'K';
      break;
    case core::PieceType::Queen:
      c = 'Q';
      break;
    case core::PieceType::Rook:
      c = 'R';
      break;
    case core::PieceType::Bishop:
      c = 'B';
      break;
    case core::PieceType::Knight:
      c = 'N';
      break;
    case core::PieceType::Pawn:
      c = 'P';
      break;
  }
  if (p.color == core::Color::Black)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return c;
}

std::string_view pieceName(core::PieceType t) noexcept {
  switch (t) {
    case core::PieceType::King:
      return "King";
    case core::PieceType::Queen:
      return "Queen";
    case core::PieceType::Rook:
      return "Rook";
    case core::PieceType::Bishop:
      return "Bishop";
    case core::PieceType::Knight:
      return "Knight";
    case core::PieceType::Pawn:
      return "Pawn";
  }
  return "";
}

std::string_view colorName(core::Color c) noexcept {
  return c == core::Color::White ? "White" : "Black";
}

std::string renderBoard(const Board& board) {
  const std::string sep = separatorRow();

  std::string out = kFilesRow;
  out += '\n';
  out += sep;

  for (int rank = core::BOARD_SIZE - 1; rank >= 0; --rank) {
    const std::string label = rankLabel(rank);
    std::string row = label + " |";
    for (int file = 0; file < core::BOARD_SIZE; ++file) {
      const auto p = board.at(core::Square{file, rank});
      row += "  ";
      row.push_back(p ? pieceSymbol(*p) : ' ');
      row += "  |";
    }
    row += label;

    out += '\n';
    out += row;
    out += '\n';
    out += sep;
  }

  out += '\n';
  out += kFilesRow;
  return out;
}

std::string describeMove(const core::Piece& p, const Move& m) {
  std::string s(colorName(p.color));
  s += ' ';
  s += pieceName(p.type);
  s += " moved from " + toNotation(m.from) + " to " + toNotation(m.to);
  return s;
}

std::string describeCapture(const core::Piece& mover, const core::Piece& captured,
                            core::Square at) {
  std::string s(colorName(mover.color));
  s += ' ';
  s += pieceName(mover.type);
  s += " captured ";
  s += colorName(captured.color);
  s += ' ';
  s += pieceName(captured.type);
  s += " at " + toNotation(at);
  return s;
}

}  // namespace chessref::model::notation
