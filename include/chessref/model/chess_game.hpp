#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include "game_state.hpp"
#include "move.hpp"

namespace chessref::model {

enum class MoveError { None, NoPiece, WrongColor, IllegalMove, LeavesKingInCheck };

std::string_view toString(MoveError e) noexcept;

struct MoveResult {
  MoveError error = MoveError::None;
  GameState state;  // successor on success, the unchanged input otherwise

  // only set on success
  std::optional<core::Piece> moved;
  std::optional<core::Piece> captured;
  bool givesCheck = false;  // new side to move is in check

  [[nodiscard]] bool ok() const noexcept { return error == MoveError::None; }
};

// Validates and applies `m`. Checks run in order and stop at the first failure:
// a piece on m.from, of the side to move, legal geometry, own king not left in check.
[[nodiscard]] MoveResult applyMove(const GameState& state, const Move& m);

class ChessGame {
 public:
  ChessGame() = default;
  explicit ChessGame(GameState start) : m_state(std::move(start)) {}

  // Applies the move if accepted. A rejected move leaves the game untouched.
  MoveResult doMove(const Move& m);

  const GameState& getGameState() const noexcept { return m_state; }
  const Board& getBoard() const noexcept { return m_state.board; }
  core::Color sideToMove() const noexcept { return m_state.sideToMove; }

  bool isKingInCheck(core::Color c) const;

 private:
  GameState m_state;
};

}  // namespace chessref::model
