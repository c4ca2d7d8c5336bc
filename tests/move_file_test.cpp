#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "chessref/io/move_file.hpp"

using namespace chessref;

static std::string writeTemp(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path.string();
}

int main() {
  // Coordinate lines become row-from-top records
  {
    const std::string path = writeTemp("chessref_move_file_test.txt",
                                       "e2e4\n\n  e7e5  \nz9a1\ne2\n");
    std::string err;
    auto file = io::MoveFile::open(path, &err);
    assert(file);
    assert(err.empty());

    auto rec = file->nextMove();
    assert(rec);
    assert((*rec == io::MoveRecord{4, 6, 4, 4}));
    assert(io::isWellFormed(*rec));

    const model::Move m = io::toMove(*rec);
    assert((m.from == core::Square{4, 1}));
    assert((m.to == core::Square{4, 3}));

    rec = file->nextMove();
    assert(rec);
    assert((*rec == io::MoveRecord{4, 1, 4, 3}));

    rec = file->nextMove();
    assert(rec);
    assert(!io::isWellFormed(*rec));

    rec = file->nextMove();
    assert(rec);
    assert(!io::isWellFormed(*rec));

    assert(!file->nextMove());
    assert(!file->nextMove());

    std::filesystem::remove(path);
  }

  // Corners of the board
  {
    assert((io::parseRecord("a8h1") == io::MoveRecord{0, 0, 7, 7}));
    assert((io::toMove(io::parseRecord("a1h8")) ==
            model::Move{core::Square{0, 0}, core::Square{7, 7}}));
    assert(!io::isWellFormed(io::parseRecord("i2e4")));
    assert(!io::isWellFormed(io::parseRecord("e0e4")));
  }

  // A record is exactly four characters
  {
    assert(!io::isWellFormed(io::parseRecord("e2e4junk")));
    assert(!io::isWellFormed(io::parseRecord("e2e4 e7e5")));
    assert(!io::isWellFormed(io::parseRecord("e2e")));

    const std::string path = writeTemp("chessref_move_file_long.txt", "e2e4x\ne7e5\n");
    std::string err;
    auto file = io::MoveFile::open(path, &err);
    assert(file);
    auto rec = file->nextMove();
    assert(rec);
    assert(!io::isWellFormed(*rec));
    std::filesystem::remove(path);
  }

  // Missing file
  {
    std::string err;
    auto file = io::MoveFile::open("/nonexistent/chessref/moves.txt", &err);
    assert(!file);
    assert(err == "Error: The specified file '/nonexistent/chessref/moves.txt' was not found");
  }

  return 0;
}
