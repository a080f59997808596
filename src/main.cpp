#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include "seed.hpp"
#include <cstdio>
#include <string>

int main() {
  std::string msg;
  if (!terminal_available(msg)) {
    std::fprintf(stderr, "kboard: %s\n", msg.c_str());
    return 1;
  }
  Terminal session;
  NcursesTerminal term;
  App app(term, term, Board(seed_items()), LogQueue(seed_log_entries()));
  app.run();
  return 0;
}
