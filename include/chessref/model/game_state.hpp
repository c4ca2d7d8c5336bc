#pragma once

#include "board.hpp"

namespace chessref::model {

// Replaced wholesale after every accepted move.
struct GameState {
  Board board = Board::initial();
  core::Color sideToMove = core::Color::White;
};

}  // namespace chessref::model
