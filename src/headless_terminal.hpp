#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render checks.
 * Records characters plus per-cell attribute (0 plain, -1 reversed,
 * >0 color pair id); drawing outside the grid is clipped.
 *
 * ScriptedKeys
 *
 * Purpose: IKeySource replaying a fixed key script; a nullopt step (and
 * every poll once the script is drained) sleeps out the timeout and
 * yields nothing.
 */
#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "key_source.hpp"

class HeadlessTerminal : public ITerminal {
public:
  static constexpr int kReversed = -1;

  HeadlessTerminal(int rows, int cols);
  ~HeadlessTerminal() override;
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;

  const std::string& line(int row) const { return cells_[row]; }
  int attr_at(int row, int col) const { return attrs_[row][col]; }
  bool contains(const std::string& text) const;
  int find_row(const std::string& text) const;
  int refresh_count() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, int attr);

  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<std::vector<int>> attrs_;
  int refreshes_ = 0;
};

class ScriptedKeys : public IKeySource {
public:
  ScriptedKeys() = default;
  explicit ScriptedKeys(std::vector<std::optional<int>> script);
  void push(std::optional<int> key) { script_.push_back(key); }
  std::optional<int> poll_key(std::chrono::milliseconds timeout) override;
  int polls() const { return polls_; }

private:
  std::deque<std::optional<int>> script_;
  int polls_ = 0;
};
