#pragma once

#include <iostream>
#include <string>
#include <utility>

#include "../io/move_file.hpp"
#include "../model/chess_game.hpp"
#include "config.hpp"

namespace chessref::app {

class App {
 public:
  explicit App(GameConfig cfg, std::ostream& out = std::cout, std::ostream& err = std::cerr)
      : m_cfg(std::move(cfg)), m_out(out), m_err(err) {}

  // Returns the process exit code.
  int run();

  // Feeds every record of `moves` into `game` until the file is exhausted or a record is
  // malformed. Rejected moves are reported and skipped.
  void playMoves(io::MoveFile& moves, model::ChessGame& game);

 private:
  void report(const model::Move& m, const model::MoveResult& res, core::Color mover);
  void log(const std::string& msg);

  GameConfig m_cfg;
  std::ostream& m_out;
  std::ostream& m_err;
};

}  // namespace chessref::app
