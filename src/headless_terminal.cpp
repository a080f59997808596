#include "headless_terminal.hpp"
#include <algorithm>
#include <thread>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(std::max(0, rows)), cols_(std::max(0, cols)) {
  clear();
}
HeadlessTerminal::~HeadlessTerminal() {}

TermSize HeadlessTerminal::get_size() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  cells_.assign(rows_, std::string(cols_, ' '));
  attrs_.assign(rows_, std::vector<int>(cols_, 0));
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int attr) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    cells_[row][c] = text[i];
    attrs_[row][c] = attr;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, 0); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  put(row, col, text.substr(0, hl_start), 0);
  put(row, col + hl_start, text.substr(hl_start, hl_end - hl_start), kReversed);
  put(row, col + hl_end, text.substr(hl_end), 0);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, color_pair_id);
}

void HeadlessTerminal::move_cursor(int, int) {}

void HeadlessTerminal::refresh() { ++refreshes_; }

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  put(row, col, std::string(std::max(0, cols_ - col), ' '), 0);
}

bool HeadlessTerminal::contains(const std::string& text) const { return find_row(text) >= 0; }

int HeadlessTerminal::find_row(const std::string& text) const {
  for (int r = 0; r < rows_; ++r) if (cells_[r].find(text) != std::string::npos) return r;
  return -1;
}

ScriptedKeys::ScriptedKeys(std::vector<std::optional<int>> script)
  : script_(script.begin(), script.end()) {}

std::optional<int> ScriptedKeys::poll_key(std::chrono::milliseconds timeout) {
  ++polls_;
  std::optional<int> k;
  if (!script_.empty()) {
    k = script_.front();
    script_.pop_front();
  }
  if (!k) std::this_thread::sleep_for(timeout);
  return k;
}
