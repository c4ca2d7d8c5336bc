#include "chessref/app/config.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace chessref::app {

void printUsage(std::ostream& os) {
  os << core::VERSION << "\n";
  os << "Usage: chessref <moves_file> [options]\n"
        "Options:\n"
        "  --no-board        Do not print the board after each accepted move\n"
        "  --show-initial    Print the starting board before processing moves\n"
        "  --fen <fen>       Start from this position instead of the standard one\n"
        "  --verbose         Print diagnostics to stderr\n"
        "  --help            Show this help\n";
}

CliResult parseArgs(int argc, const char* const* argv, std::ostream& err) {
  CliResult res;
  GameConfig cfg;
  std::vector<std::string> positional;

  auto fail = [&](int code) {
    printUsage(err);
    res.exitCode = code;
    return res;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      return fail(0);
    } else if (arg == "--no-board") {
      cfg.renderBoard = false;
    } else if (arg == "--show-initial") {
      cfg.showInitial = true;
    } else if (arg == "--verbose") {
      cfg.verbose = true;
    } else if (arg == "--fen") {
      if (i + 1 >= argc) {
        err << "Missing value for --fen\n";
        return fail(1);
      }
      cfg.startFen = argv[++i];
    } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      err << "Unknown option " << arg << "\n";
      return fail(1);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 1) return fail(1);

  cfg.movesFile = positional.front();
  res.config = cfg;
  return res;
}

}  // namespace chessref::app
