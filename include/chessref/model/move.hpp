#pragma once
#include "../chess_types.hpp"

namespace chessref::model {

struct Move {
  core::Square from{};
  core::Square to{};
};

constexpr inline bool operator==(const Move& a, const Move& b) noexcept {
  return a.from == b.from && a.to == b.to;
}

}  // namespace chessref::model
