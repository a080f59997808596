#include "pane_layout.hpp"
#include <algorithm>

std::vector<Rect> split_vertical(const Rect& area, int parts) {
  std::vector<Rect> out;
  if (parts <= 0) return out;
  int base = std::max(0, area.width) / parts;
  int extra = std::max(0, area.width) % parts;
  int col = area.col;
  for (int i = 0; i < parts; ++i) {
    int w = base + (i < extra ? 1 : 0); // leftmost columns absorb the remainder
    out.push_back(Rect{area.row, col, std::max(0, area.height), w});
    col += w;
  }
  return out;
}

Rect split_bottom(Rect& area, int height) {
  int h = std::clamp(height, 0, std::max(0, area.height));
  Rect bottom{area.row + area.height - h, area.col, h, area.width};
  area.height -= h;
  return bottom;
}

BoardLayout compute_layout(const Rect& screen, int log_rows) {
  BoardLayout out;
  Rect rest = screen;
  rest.height = std::max(0, rest.height);
  out.status = split_bottom(rest, 1);
  // keep at least three rows (borders + one line) for the columns when possible
  int log_h = std::min(std::max(0, log_rows), std::max(0, rest.height - 3));
  out.log = split_bottom(rest, log_h);
  auto cols = split_vertical(rest, 3);
  for (int i = 0; i < 3; ++i) out.columns[i] = cols[i];
  return out;
}
