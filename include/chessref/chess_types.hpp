#pragma once
#include <cstdint>

namespace chessref::core {

constexpr int BOARD_SIZE = 8;

enum class PieceType : std::uint8_t { Pawn, Knight, Bishop, Rook, Queen, King };
enum class Color : std::uint8_t { White = 0, Black = 1 };

constexpr inline core::Color operator~(core::Color c) {
  return c == core::Color::White ? core::Color::Black : core::Color::White;
}

struct Piece {
  PieceType type = PieceType::Pawn;
  Color color = Color::White;
};

constexpr inline bool operator==(const Piece& a, const Piece& b) noexcept {
  return a.type == b.type && a.color == b.color;
}

// file 0..7 = a..h, rank 0..7 = 1..8. Not range checked on construction.
struct Square {
  int file = 0;
  int rank = 0;

  [[nodiscard]] constexpr bool valid() const noexcept {
    return file >= 0 && file < BOARD_SIZE && rank >= 0 && rank < BOARD_SIZE;
  }
};

constexpr inline bool operator==(const Square& a, const Square& b) noexcept {
  return a.file == b.file && a.rank == b.rank;
}

}  // namespace chessref::core
