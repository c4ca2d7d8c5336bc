#include "chessref/model/move_validator.hpp"

#include <algorithm>
#include <cassert>
#include <cstdlib>

namespace chessref::model {

namespace {

inline int sign(int v) noexcept {
  return (v > 0) - (v < 0);
}

inline int fileDelta(const Move& m) noexcept {
  return m.to.file - m.from.file;
}
inline int rankDelta(const Move& m) noexcept {
  return m.to.rank - m.from.rank;
}

bool isKingMove(const Move& m) {
  return std::abs(fileDelta(m)) <= 1 && std::abs(rankDelta(m)) <= 1;
}

bool isRookMove(const Board& board, const Move& m) {
  return (m.from.file == m.to.file || m.from.rank == m.to.rank) && !isPathBlocked(board, m);
}

bool isBishopMove(const Board& board, const Move& m) {
  return std::abs(fileDelta(m)) == std::abs(rankDelta(m)) && !isPathBlocked(board, m);
}

bool isQueenMove(const Board& board, const Move& m) {
  return isRookMove(board, m) || isBishopMove(board, m);
}

bool isKnightMove(const Move& m) {
  const int df = std::abs(fileDelta(m));
  const int dr = std::abs(rankDelta(m));
  return (df == 2 && dr == 1) || (df == 1 && dr == 2);
}

bool isPawnMove(const Board& board, const Move& m, core::Color color) {
  const int dir = (color == core::Color::White) ? 1 : -1;
  const int startRank = (color == core::Color::White) ? 1 : 6;
  const int dr = rankDelta(m);

  // single step
  if (m.from.file == m.to.file && dr == dir && board.isEmpty(m.to)) return true;

  // double step from the start rank, both squares must be free
  if (m.from.file == m.to.file && dr == 2 * dir && m.from.rank == startRank &&
      board.isEmpty(core::Square{m.from.file, m.from.rank + dir}) && board.isEmpty(m.to))
    return true;

  // diagonal capture
  if (std::abs(fileDelta(m)) == 1 && dr == dir) {
    const auto target = board.at(m.to);
    return target && target->color != color;
  }
  return false;
}

}  // namespace

bool isPathBlocked(const Board& board, const Move& m) {
  const int stepFile = sign(fileDelta(m));
  const int stepRank = sign(rankDelta(m));
  const int steps = std::max(std::abs(fileDelta(m)), std::abs(rankDelta(m))) - 1;

  for (int i = 1; i <= steps; ++i) {
    const core::Square sq{m.from.file + i * stepFile, m.from.rank + i * stepRank};
    if (!board.isEmpty(sq)) return true;
  }
  return false;
}

bool isLegalMove(const Board& board, const Move& m, const core::Piece& piece) {
  const auto target = board.at(m.to);
  if (target && target->color == piece.color) return false;

  switch (piece.type) {
    case core::PieceType::King:
      return isKingMove(m);
    case core::PieceType::Queen:
      return isQueenMove(board, m);
    case core::PieceType::Rook:
      return isRookMove(board, m);
    case core::PieceType::Bishop:
      return isBishopMove(board, m);
    case core::PieceType::Knight:
      return isKnightMove(m);
    case core::PieceType::Pawn:
      return isPawnMove(board, m, piece.color);
  }
  return false;
}

bool isInCheck(const Board& board, core::Color c) {
  const auto ksq = board.findKing(c);
  assert(ksq && "isInCheck: no king of the given color on the board");
  if (!ksq) return false;

  const core::Color them = ~c;
  for (int rank = 0; rank < core::BOARD_SIZE; ++rank) {
    for (int file = 0; file < core::BOARD_SIZE; ++file) {
      const core::Square from{file, rank};
      const auto p = board.at(from);
      if (p && p->color == them && isLegalMove(board, Move{from, *ksq}, *p)) return true;
    }
  }
  return false;
}

}  // namespace chessref::model
