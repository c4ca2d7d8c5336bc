#include "chessref/model/chess_game.hpp"

#include <utility>

#include "chessref/model/move_validator.hpp"

namespace chessref::model {

std::string_view toString(MoveError e) noexcept {
  switch (e) {
    case MoveError::None:
      return "";
    case MoveError::NoPiece:
      return "No piece at the starting position";
    case MoveError::WrongColor:
      return "Not the current player's piece";
    case MoveError::IllegalMove:
      return "Invalid move";
    case MoveError::LeavesKingInCheck:
      return "Move leaves the player in check";
  }
  return "";
}

MoveResult applyMove(const GameState& state, const Move& m) {
  MoveResult res;
  res.state = state;

  const auto piece = state.board.at(m.from);
  if (!piece) {
    res.error = MoveError::NoPiece;
    return res;
  }
  if (piece->color != state.sideToMove) {
    res.error = MoveError::WrongColor;
    return res;
  }
  if (!isLegalMove(state.board, m, *piece)) {
    res.error = MoveError::IllegalMove;
    return res;
  }

  Board next = state.board.withPieceMoved(m);
  if (isInCheck(next, state.sideToMove)) {
    res.error = MoveError::LeavesKingInCheck;
    return res;
  }

  res.moved = piece;
  res.captured = state.board.at(m.to);
  res.state = GameState{std::move(next), ~state.sideToMove};
  res.givesCheck = isInCheck(res.state.board, res.state.sideToMove);
  return res;
}

MoveResult ChessGame::doMove(const Move& m) {
  MoveResult res = applyMove(m_state, m);
  if (res.ok()) m_state = res.state;
  return res;
}

bool ChessGame::isKingInCheck(core::Color c) const {
  return isInCheck(m_state.board, c);
}

}  // namespace chessref::model
