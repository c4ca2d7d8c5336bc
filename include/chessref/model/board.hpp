#pragma once
#include <array>
#include <optional>

#include "../chess_types.hpp"
#include "move.hpp"

namespace chessref::model {

class Board {
 public:
  // Empty board. Use initial() for the standard starting position.
  Board() = default;

  static Board initial();

  void clear() noexcept;

  // Caller responsibility: sq must be on the board.
  [[nodiscard]] std::optional<core::Piece> at(core::Square sq) const noexcept {
    return m_cells[sq.rank][sq.file];
  }
  [[nodiscard]] bool isEmpty(core::Square sq) const noexcept { return !at(sq).has_value(); }

  // In-place edit, used while setting up a position.
  void setPiece(core::Square sq, std::optional<core::Piece> p) noexcept;

  // Returns a copy with the piece on m.from relocated to m.to. No legality check:
  // whatever stood on m.to is overwritten.
  [[nodiscard]] Board withPieceMoved(const Move& m) const;

  // Empty if the color has no king on the board.
  [[nodiscard]] std::optional<core::Square> findKing(core::Color c) const noexcept;

  friend bool operator==(const Board& a, const Board& b) noexcept {
    return a.m_cells == b.m_cells;
  }

 private:
  // [rank][file]
  std::array<std::array<std::optional<core::Piece>, core::BOARD_SIZE>, core::BOARD_SIZE>
      m_cells{};
};

}  // namespace chessref::model
