#include "terminal.hpp"
#include <locale.h>
#include <stdlib.h>
#include <unistd.h>
#include <term.h>

bool terminal_available(std::string& msg) {
  if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
    msg = "stdin and stdout must be a terminal";
    return false;
  }
  const char* term = getenv("TERM");
  if (!term || !*term) { msg = "TERM is not set"; return false; }
  int err = 0;
  if (setupterm(term, STDOUT_FILENO, &err) != OK) {
    msg = err == 0 ? std::string("unknown terminal type: ") + term
                   : std::string("can not find terminfo database");
    return false;
  }
  del_curterm(cur_term);
  return true;
}

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  endwin();
}
