#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: check terminal_available() first, then construct in main;
 *        destructor restores terminal.
 * Note: manages terminal modes (cbreak/noecho/keypad), not rendering.
 */
#include <ncurses.h>
#include <string>

bool terminal_available(std::string& msg);

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
