#include <exception>
#include <iostream>

#include "chessref/app/app.hpp"
#include "chessref/app/config.hpp"

int main(int argc, char** argv) {
  auto cli = chessref::app::parseArgs(argc, argv, std::cerr);
  if (!cli.config) return cli.exitCode;

  try {
    chessref::app::App app(*cli.config);
    return app.run();
  } catch (const std::exception& e) {
    std::cout << "An unexpected error occurred: " << e.what() << "\n";
    return 1;
  }
}
