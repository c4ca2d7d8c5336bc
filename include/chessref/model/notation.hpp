#pragma once
#include <string>
#include <string_view>

#include "board.hpp"
#include "move.hpp"

namespace chessref::model::notation {

// "a1" .. "h8". Square must be on the board.
std::string toNotation(core::Square sq);

// K Q R B N P for White, lowercase for Black.
char pieceSymbol(const core::Piece& p) noexcept;
std::string_view pieceName(core::PieceType t) noexcept;
std::string_view colorName(core::Color c) noexcept;

// Fixed width grid, rank 8 at the top, framed by file letters and rank numbers.
// Lines are separated by '\n' without a trailing newline.
std::string renderBoard(const Board& board);

// "White Pawn moved from e2 to e4"
std::string describeMove(const core::Piece& p, const Move& m);
// "White Queen captured Black Pawn at d7"
std::string describeCapture(const core::Piece& mover, const core::Piece& captured,
                            core::Square at);

}  // namespace chessref::model::notation
