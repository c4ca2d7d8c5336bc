#pragma once

#include <string>
#include <string_view>

namespace chessref::core {
const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1";
inline constexpr std::string_view VERSION{"chessref 1.0"};
}  // namespace chessref::core
