#pragma once
#include <iosfwd>
#include <optional>
#include <string>

#include "../constants.hpp"

namespace chessref::app {

struct GameConfig {
  std::string movesFile;
  std::string startFen = core::START_FEN;
  bool renderBoard = true;   // print the board after every accepted move
  bool showInitial = false;  // print the start position before the first move
  bool verbose = false;      // [Tag] diagnostics on stderr
};

struct CliResult {
  std::optional<GameConfig> config;  // empty => exit with exitCode
  int exitCode = 0;
};

// chessref <moves_file> [--no-board] [--show-initial] [--fen "<fen>"] [--verbose] [--help]
// Usage and argument errors are written to `err`.
CliResult parseArgs(int argc, const char* const* argv, std::ostream& err);

void printUsage(std::ostream& os);

}  // namespace chessref::app
