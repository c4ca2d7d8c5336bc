#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "chessref/app/app.hpp"
#include "chessref/app/config.hpp"

using namespace chessref;

static std::string writeTemp(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path.string();
}

static app::CliResult parse(std::vector<const char*> args, std::ostream& err) {
  args.insert(args.begin(), "chessref");
  return app::parseArgs(static_cast<int>(args.size()), args.data(), err);
}

static bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

int main() {
  // Argument handling
  {
    std::ostringstream err;
    auto cli = parse({}, err);
    assert(!cli.config);
    assert(cli.exitCode == 1);
    assert(contains(err.str(), "Usage: chessref"));

    cli = parse({"a.txt", "b.txt"}, err);
    assert(!cli.config);
    assert(cli.exitCode == 1);

    cli = parse({"--bogus", "a.txt"}, err);
    assert(!cli.config);
    assert(cli.exitCode == 1);

    cli = parse({"a.txt", "--fen"}, err);
    assert(!cli.config);
    assert(cli.exitCode == 1);

    cli = parse({"--help"}, err);
    assert(!cli.config);
    assert(cli.exitCode == 0);

    cli = parse({"moves.txt"}, err);
    assert(cli.config);
    assert(cli.config->movesFile == "moves.txt");
    assert(cli.config->renderBoard);
    assert(!cli.config->showInitial);

    cli = parse({"--no-board", "moves.txt", "--fen", "4k3/8/8/8/8/8/8/4K3 b", "--show-initial"},
                err);
    assert(cli.config);
    assert(cli.config->movesFile == "moves.txt");
    assert(!cli.config->renderBoard);
    assert(cli.config->showInitial);
    assert(cli.config->startFen == "4k3/8/8/8/8/8/8/4K3 b");
  }

  // Accepted, rejected and capturing moves
  {
    app::GameConfig cfg;
    cfg.movesFile = writeTemp("chessref_app_test_game.txt", "e2e4\ne2e4\nd7d5\ne4d5\n");
    std::ostringstream out, err;
    app::App a(cfg, out, err);
    assert(a.run() == 0);

    const std::string log = out.str();
    assert(contains(log, "Processing White move from e2 to e4"));
    assert(contains(log, "White Pawn moved from e2 to e4"));
    assert(contains(log, "Processing Black move from e2 to e4"));
    assert(contains(log, "Invalid move: No piece at the starting position"));
    assert(contains(log, "Black Pawn moved from d7 to d5"));
    assert(contains(log, "White Pawn captured Black Pawn at d5"));
    assert(contains(log, " 8 |  r  |  n  |  b  |  q  |  k  |  b  |  n  |  r  | 8"));
    assert(contains(log, "No more moves available - GAME OVER"));
    assert(!contains(log, "is in check!"));
    std::filesystem::remove(cfg.movesFile);
  }

  // Check warning, no board output
  {
    app::GameConfig cfg;
    cfg.movesFile = writeTemp("chessref_app_test_check.txt", "f2f3\ne7e5\ng2g4\nd8h4\n");
    cfg.renderBoard = false;
    std::ostringstream out, err;
    app::App a(cfg, out, err);
    assert(a.run() == 0);

    const std::string log = out.str();
    assert(contains(log, "Black Queen moved from d8 to h4"));
    assert(contains(log, "White is in check!"));
    assert(!contains(log, "+-----+"));
    std::filesystem::remove(cfg.movesFile);
  }

  // A malformed record stops processing
  {
    app::GameConfig cfg;
    cfg.movesFile = writeTemp("chessref_app_test_bad.txt", "e2e4\nx9\ne7e5\n");
    std::ostringstream out, err;
    app::App a(cfg, out, err);
    assert(a.run() == 0);

    const std::string log = out.str();
    assert(contains(log, "White Pawn moved from e2 to e4"));
    assert(contains(log, "Error in moves file format"));
    assert(!contains(log, "e7 to e5"));
    assert(!contains(log, "GAME OVER"));
    std::filesystem::remove(cfg.movesFile);
  }

  // Custom start position
  {
    app::GameConfig cfg;
    cfg.movesFile = writeTemp("chessref_app_test_fen.txt", "e2d2\ne2e8\n");
    cfg.startFen = "4r2k/8/8/8/8/8/4R3/4K3 w";
    cfg.renderBoard = false;
    std::ostringstream out, err;
    app::App a(cfg, out, err);
    assert(a.run() == 0);

    const std::string log = out.str();
    assert(contains(log, "Invalid move: Move leaves the player in check"));
    assert(contains(log, "White Rook captured Black Rook at e8"));
    std::filesystem::remove(cfg.movesFile);
  }

  // Start position errors and missing files end the run
  {
    app::GameConfig cfg;
    cfg.movesFile = "/nonexistent/chessref/moves.txt";
    std::ostringstream out, err;
    app::App a(cfg, out, err);
    assert(a.run() == 1);
    assert(contains(out.str(), "Error: The specified file"));

    app::GameConfig badFen;
    badFen.movesFile = cfg.movesFile;
    badFen.startFen = "8/8/8/8/8/8/8/8 w";
    std::ostringstream out2, err2;
    app::App b(badFen, out2, err2);
    assert(b.run() == 1);
    assert(contains(err2.str(), "Error:"));

    // start position where the side that just moved is still in check
    app::GameConfig checked;
    checked.movesFile = cfg.movesFile;
    checked.startFen = "4k3/8/8/8/8/8/8/4RK2 w";
    std::ostringstream out3, err3;
    app::App c(checked, out3, err3);
    assert(c.run() == 1);
    assert(contains(err3.str(), "check"));
    assert(out3.str().empty());
  }

  return 0;
}
