#pragma once
#include "board.hpp"
#include "move.hpp"

namespace chessref::model {

// Geometric legality of `m` for `piece` on `board`: piece movement rules, path
// clearance for sliders and the pawn forward/double/capture rules. Does not look at
// whether the move exposes the mover's own king. No castling, en passant or promotion.
[[nodiscard]] bool isLegalMove(const Board& board, const Move& m, const core::Piece& piece);

// True if any square strictly between m.from and m.to is occupied. Only meaningful for
// straight or diagonal lines.
[[nodiscard]] bool isPathBlocked(const Board& board, const Move& m);

// True if some piece of the opposite color can legally move onto c's king.
// Precondition: exactly one king of color c is on the board.
[[nodiscard]] bool isInCheck(const Board& board, core::Color c);

}  // namespace chessref::model
