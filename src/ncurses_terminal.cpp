#include "ncurses_terminal.hpp"
#include <algorithm>
#include <climits>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(PairAccent, COLOR_YELLOW, -1);
      init_pair(PairDefault, -1, -1);
      init_pair(PairWarning, COLOR_YELLOW, -1);
      init_pair(PairError, COLOR_RED, -1);
    } else {
      init_pair(PairAccent, COLOR_YELLOW, COLOR_BLACK); // fallback
      init_pair(PairDefault, COLOR_WHITE, COLOR_BLACK);
      init_pair(PairWarning, COLOR_YELLOW, COLOR_BLACK);
      init_pair(PairError, COLOR_RED, COLOR_BLACK);
    }
    init_pair(PairActive, COLOR_BLACK, COLOR_YELLOW);
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(PairDefault));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(PairDefault));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  int hl_end = std::min(len, hl_start + hl_len);
  hl_start = std::min(hl_start, len);
  if (hl_start > 0) {
    std::string left = text.substr(0, hl_start);
    mvaddnstr(row, col, left.c_str(), (int)left.size());
    col += (int)left.size();
  }
  if (hl_end > hl_start) {
    std::string mid = text.substr(hl_start, hl_end - hl_start);
    attron(A_REVERSE | A_BOLD);
    mvaddnstr(row, col, mid.c_str(), (int)mid.size());
    attroff(A_REVERSE | A_BOLD);
    col += (int)mid.size();
  }
  if (hl_end < len) {
    std::string right = text.substr(hl_end);
    mvaddnstr(row, col, right.c_str(), (int)right.size());
  }
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  else if (color_pair_id == PairActive) attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
  else if (color_pair_id == PairActive) attroff(A_REVERSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

std::optional<int> NcursesTerminal::poll_key(std::chrono::milliseconds timeout) {
  auto ms = std::clamp<long long>(timeout.count(), 0, INT_MAX);
  ::timeout(static_cast<int>(ms));
  int ch = getch();
  if (ch == ERR) return std::nullopt;
  return ch;
}
