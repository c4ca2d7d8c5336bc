#pragma once

#include <optional>
#include <string>

#include "game_state.hpp"

namespace chessref::model::fen {

// Structural check of a FEN string: eight ranks of eight squares and a 'w' or 'b' side to
// move. Any fields after the side to move are ignored.
bool isFenWellFormed(const std::string& fen);

// Builds a game state from a FEN string. Fields after the side to move are ignored,
// since castling and en passant are not part of this rule set. Fails if the text is
// malformed, if either side does not have exactly one king, or if the side not to move
// is in check. On failure `err` names the reason, including the bad rank where there is one.
std::optional<GameState> parseFen(const std::string& fen, std::string* err = nullptr);

}  // namespace chessref::model::fen
