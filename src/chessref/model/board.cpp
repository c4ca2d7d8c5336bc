#include "chessref/model/board.hpp"

#include <cassert>

namespace chessref::model {

namespace {
constexpr std::array<core::PieceType, core::BOARD_SIZE> kBackRank = {
    core::PieceType::Rook,   core::PieceType::Knight, core::PieceType::Bishop,
    core::PieceType::Queen,  core::PieceType::King,   core::PieceType::Bishop,
    core::PieceType::Knight, core::PieceType::Rook};
}  // namespace

Board Board::initial() {
  Board b;
  for (int file = 0; file < core::BOARD_SIZE; ++file) {
    b.m_cells[0][file] = core::Piece{kBackRank[file], core::Color::White};
    b.m_cells[1][file] = core::Piece{core::PieceType::Pawn, core::Color::White};
    b.m_cells[6][file] = core::Piece{core::PieceType::Pawn, core::Color::Black};
    b.m_cells[7][file] = core::Piece{kBackRank[file], core::Color::Black};
  }
  return b;
}

void Board::clear() noexcept {
  for (auto& row : m_cells) row.fill(std::nullopt);
}

void Board::setPiece(core::Square sq, std::optional<core::Piece> p) noexcept {
  assert(sq.valid());
  m_cells[sq.rank][sq.file] = p;
}

Board Board::withPieceMoved(const Move& m) const {
  Board next = *this;
  const std::optional<core::Piece> moving = at(m.from);
  next.m_cells[m.from.rank][m.from.file].reset();
  next.m_cells[m.to.rank][m.to.file] = moving;
  return next;
}

std::optional<core::Square> Board::findKing(core::Color c) const noexcept {
  for (int rank = 0; rank < core::BOARD_SIZE; ++rank) {
    for (int file = 0; file < core::BOARD_SIZE; ++file) {
      const auto& cell = m_cells[rank][file];
      if (cell && cell->type == core::PieceType::King && cell->color == c)
        return core::Square{file, rank};
    }
  }
  return std::nullopt;
}

}  // namespace chessref::model
