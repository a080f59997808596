#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal + IKeySource implementation using ncurses.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include "key_source.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal, public IKeySource {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  std::optional<int> poll_key(std::chrono::milliseconds timeout) override;
};
