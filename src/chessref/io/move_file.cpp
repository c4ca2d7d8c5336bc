#include "chessref/io/move_file.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace chessref::io {

namespace {
// Anything shorter than a full coordinate move maps to this.
constexpr int kInvalid = -1;

std::string trim(const std::string& s) {
  std::size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
  return s.substr(a, b - a);
}
}  // namespace

std::optional<MoveFile> MoveFile::open(const std::string& path, std::string* err) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    if (err) *err = "Error: The specified file '" + path + "' was not found";
    return std::nullopt;
  }
  if (std::filesystem::is_directory(path, ec)) {
    if (err) *err = "Error reading moves: '" + path + "' is a directory";
    return std::nullopt;
  }
  std::ifstream in(path);
  if (!in) {
    if (err) *err = "Error reading moves: cannot open '" + path + "' for reading";
    return std::nullopt;
  }
  return MoveFile(std::move(in), path);
}

std::optional<MoveRecord> MoveFile::nextMove() {
  std::string line;
  while (std::getline(m_in, line)) {
    line = trim(line);
    if (line.empty()) continue;
    return parseRecord(line);
  }
  if (m_in.bad()) throw std::runtime_error("read failed on '" + m_path + "'");
  return std::nullopt;
}

MoveRecord parseRecord(const std::string& line) {
  if (line.size() != 4) return {kInvalid, kInvalid, kInvalid, kInvalid};
  return {line[0] - 'a', '8' - line[1], line[2] - 'a', '8' - line[3]};
}

bool isWellFormed(const MoveRecord& rec) noexcept {
  return std::all_of(rec.begin(), rec.end(), [](int v) { return v >= 0 && v < 8; });
}

model::Move toMove(const MoveRecord& rec) noexcept {
  return model::Move{core::Square{rec[0], 7 - rec[1]}, core::Square{rec[2], 7 - rec[3]}};
}

}  // namespace chessref::io
