#include "chessref/app/app.hpp"

#include <stdexcept>
#include <string>

#include "chessref/model/fen.hpp"
#include "chessref/model/notation.hpp"

namespace chessref::app {

namespace notation = model::notation;

void App::log(const std::string& msg) {
  if (m_cfg.verbose) m_err << "[App] " << msg << "\n";
}

int App::run() {
  std::string err;
  auto start = model::fen::parseFen(m_cfg.startFen, &err);
  if (!start) {
    m_err << "Error: " << err << "\n";
    return 1;
  }

  auto moves = io::MoveFile::open(m_cfg.movesFile, &err);
  if (!moves) {
    m_out << err << "\n";
    return 1;
  }
  log("reading moves from " + moves->path());

  model::ChessGame game(std::move(*start));
  if (m_cfg.showInitial) m_out << notation::renderBoard(game.getBoard()) << "\n";

  try {
    playMoves(*moves, game);
  } catch (const std::runtime_error& e) {
    m_out << "Error reading moves: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

void App::playMoves(io::MoveFile& moves, model::ChessGame& game) {
  int accepted = 0;
  int rejected = 0;

  while (auto rec = moves.nextMove()) {
    if (!io::isWellFormed(*rec)) {
      m_out << "Error in moves file format\n";
      log("stopped after " + std::to_string(accepted) + " accepted, " +
          std::to_string(rejected) + " rejected");
      return;
    }

    const model::Move m = io::toMove(*rec);
    const core::Color mover = game.sideToMove();
    m_out << "\nProcessing " << notation::colorName(mover) << " move from "
          << notation::toNotation(m.from) << " to " << notation::toNotation(m.to) << "\n";

    const model::MoveResult res = game.doMove(m);
    report(m, res, mover);
    if (res.ok())
      ++accepted;
    else
      ++rejected;
  }

  m_out << "No more moves available - GAME OVER\n";
  log("finished with " + std::to_string(accepted) + " accepted, " + std::to_string(rejected) +
      " rejected");
}

void App::report(const model::Move& m, const model::MoveResult& res, core::Color mover) {
  if (!res.ok()) {
    m_out << "Invalid move: " << model::toString(res.error) << "\n";
    return;
  }

  m_out << notation::describeMove(*res.moved, m) << "\n";
  if (res.captured) m_out << notation::describeCapture(*res.moved, *res.captured, m.to) << "\n";
  if (res.givesCheck) m_out << notation::colorName(~mover) << " is in check!\n";

  if (m_cfg.renderBoard) m_out << notation::renderBoard(res.state.board) << "\n\n";
}

}  // namespace chessref::app
