#pragma once

#include <array>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include "../model/move.hpp"

namespace chessref::io {

// {fromFile, fromRow, toFile, toRow}. Rows count from the top of the board,
// so row 0 is rank 8.
using MoveRecord = std::array<int, 4>;

// Reads coordinate moves ("e2e4"), one per line, blank lines skipped.
class MoveFile {
 public:
  // On failure `err` receives the user-facing message.
  static std::optional<MoveFile> open(const std::string& path, std::string* err = nullptr);

  // Empty once the file is exhausted. A line that is not a coordinate move still
  // yields a record, with components outside [0,7]. Throws std::runtime_error if the
  // underlying stream fails mid-read.
  std::optional<MoveRecord> nextMove();

  const std::string& path() const noexcept { return m_path; }

 private:
  MoveFile(std::ifstream in, std::string path) : m_in(std::move(in)), m_path(std::move(path)) {}

  std::ifstream m_in;
  std::string m_path;
};

// Splits a four-character coordinate line ("e2e4") into a record. Any other length gives
// a record that fails isWellFormed.
MoveRecord parseRecord(const std::string& line);

bool isWellFormed(const MoveRecord& rec) noexcept;

// Converts rows back to internal ranks (rank = 7 - row).
model::Move toMove(const MoveRecord& rec) noexcept;

}  // namespace chessref::io
